#ifndef PASTEALL_CRYPTO_ENGINE_HPP
#define PASTEALL_CRYPTO_ENGINE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace pasteall::crypto {

using Bytes = std::vector<std::uint8_t>;

// X25519 key agreement pair
struct KeyPair {
  Bytes public_key;
  Bytes secret_key;

  static KeyPair generate();
  // Rebuilds the public half from persisted secret material
  static KeyPair from_secret(const Bytes& secret_key);
};

// Ed25519 signing pair
struct SignKeyPair {
  Bytes public_key;
  Bytes seed;

  static SignKeyPair generate();
  static SignKeyPair from_seed(const Bytes& seed);
};

/**
 * Holds the local identity and one symmetric key per paired device.
 *
 * Symmetric encryption is ChaCha20-Poly1305 keyed with HKDF-SHA256 over the
 * X25519 agreement, framed as nonce || ciphertext || tag. First contact uses an
 * anonymous sealed box: ephemeral public key || ciphertext || tag.
 *
 * All methods are safe to call from several threads.
 */
class CryptoEngine {
public:
  static constexpr std::size_t KEY_SIZE = 32;
  static constexpr std::size_t NONCE_SIZE = 12;
  static constexpr std::size_t TAG_SIZE = 16;
  static constexpr std::size_t SIGNATURE_SIZE = 64;
  static constexpr std::size_t SEAL_OVERHEAD = KEY_SIZE + TAG_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Generates a fresh identity
  CryptoEngine();
  // Adopts a persisted identity
  CryptoEngine(KeyPair keys, SignKeyPair sign_keys);
  ~CryptoEngine() = default;

  CryptoEngine(const CryptoEngine&) = delete;
  CryptoEngine& operator=(const CryptoEngine&) = delete;


  // ---- IDENTITY ----
  // Replaces both keypairs; derived shared keys are kept
  void generate_identity();
  std::string public_key_base64() const;
  std::string signing_key_base64() const;
  KeyPair key_pair() const;
  SignKeyPair sign_key_pair() const;


  // ---- SHARED KEYS ----
  // Agrees on a symmetric key with the remote X25519 key and caches it under device_id.
  // Last write wins.
  void derive_shared_key(const std::string& device_id, const std::string& remote_public_key_base64);
  bool has_shared_key(const std::string& device_id) const;
  bool remove_shared_key(const std::string& device_id);
  std::size_t shared_key_count() const;


  // ---- SYMMETRIC ENCRYPTION ----
  // Output is nonce || ciphertext || tag, fresh nonce per call
  Bytes encrypt(const std::string& device_id, const Bytes& plaintext) const;
  Bytes decrypt(const std::string& device_id, const Bytes& data) const;


  // ---- SIGNATURES ----
  Bytes sign(const Bytes& data) const;
  bool verify(const Bytes& signature, const Bytes& data, const std::string& signer_public_key_base64) const;


  // ---- FIRST CONTACT ----
  // Anonymous encryption to a public key, no shared key required
  Bytes seal_for_first_contact(const std::string& recipient_public_key_base64, const Bytes& data) const;
  Bytes open_first_contact(const Bytes& sealed) const;


  // ---- RANDOMNESS ----
  // Six digit numeric string, uniform in [100000, 999999]
  static std::string generate_pin();
  static Bytes random_bytes(std::size_t length);

private:
  struct SharedKeyEntry {
    Bytes remote_public_key;
    Bytes key;
  };

  // ---- PARAMETERS ----
  mutable std::mutex identity_mutex_;
  KeyPair keys_;
  SignKeyPair sign_keys_;

  mutable std::mutex shared_keys_mutex_;
  std::unordered_map<std::string, SharedKeyEntry> shared_keys_;


  // ---- HELPERS ----
  Bytes lookup_key(const std::string& device_id) const;
};

// Decodes a base64 key and checks its length, throws InvalidKeyError
Bytes decode_key(const std::string& key_base64, std::size_t expected_size);

} // namespace pasteall::crypto

#endif // PASTEALL_CRYPTO_ENGINE_HPP
