#include "crypto/crypto_engine.hpp"
#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <memory>
#include <boost/log/trivial.hpp>

namespace pasteall::crypto {

namespace {

const std::string SHARED_KEY_INFO = "pasteall v1 shared key";
const std::string SEALED_BOX_INFO = "pasteall v1 sealed box";

//=================================================
// RAII WRAPPERS FOR OPENSSL HANDLES
//=================================================

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

//=================================================
// KEY HANDLING
//=================================================

PkeyPtr generate_key(int type) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
    throw InitializationError("Failed to initialize key generation");
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
    throw InitializationError("Key generation failed");
  }
  return PkeyPtr(raw);
}

PkeyPtr load_private(int type, const Bytes& secret) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(type, nullptr, secret.data(), secret.size()));
  if (!key) {
    throw InvalidKeyError("Cannot load private key");
  }
  return key;
}

PkeyPtr load_public(int type, const Bytes& public_key) {
  PkeyPtr key(EVP_PKEY_new_raw_public_key(type, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    throw InvalidKeyError("Cannot load public key");
  }
  return key;
}

Bytes raw_public(EVP_PKEY* key) {
  std::size_t length = CryptoEngine::KEY_SIZE;
  Bytes out(length);
  if (EVP_PKEY_get_raw_public_key(key, out.data(), &length) <= 0) {
    throw CryptoError("Cannot export public key");
  }
  out.resize(length);
  return out;
}

Bytes raw_private(EVP_PKEY* key) {
  std::size_t length = CryptoEngine::KEY_SIZE;
  Bytes out(length);
  if (EVP_PKEY_get_raw_private_key(key, out.data(), &length) <= 0) {
    throw CryptoError("Cannot export private key");
  }
  out.resize(length);
  return out;
}

Bytes x25519_agree(const Bytes& secret_key, const Bytes& peer_public_key) {
  auto local = load_private(EVP_PKEY_X25519, secret_key);
  auto peer = load_public(EVP_PKEY_X25519, peer_public_key);

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(local.get(), nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0) {
    throw CryptoError("Failed to initialize key agreement");
  }
  // Fails for low order peer points
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) <= 0) {
    throw InvalidKeyError("Peer key rejected");
  }

  std::size_t length = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &length) <= 0) {
    throw CryptoError("Key agreement failed");
  }
  Bytes secret(length);
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &length) <= 0) {
    throw InvalidKeyError("Key agreement produced no secret");
  }
  secret.resize(length);
  return secret;
}

Bytes hkdf_sha256(const Bytes& ikm, const Bytes& salt, const std::string& info) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0) {
    throw CryptoError("HKDF init failed");
  }
  if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0) {
    throw CryptoError("HKDF set md failed");
  }
  if (!salt.empty() &&
      EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
    throw CryptoError("HKDF set salt failed");
  }
  if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0) {
    throw CryptoError("HKDF set key failed");
  }
  if (EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                  reinterpret_cast<const unsigned char*>(info.data()),
                                  static_cast<int>(info.size())) <= 0) {
    throw CryptoError("HKDF set info failed");
  }

  Bytes out(CryptoEngine::KEY_SIZE);
  std::size_t length = out.size();
  if (EVP_PKEY_derive(ctx.get(), out.data(), &length) <= 0 || length != out.size()) {
    throw CryptoError("HKDF derive failed");
  }
  return out;
}

Bytes sha256(const Bytes& data) {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  Bytes digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if (!ctx ||
      !EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx.get(), data.data(), data.size()) ||
      !EVP_DigestFinal_ex(ctx.get(), digest.data(), &length)) {
    throw CryptoError("SHA-256 failed");
  }
  digest.resize(length);
  return digest;
}

//=================================================
// AEAD
//=================================================

// Returns ciphertext || tag
Bytes aead_seal(const Bytes& key, const Bytes& nonce, const Bytes& plaintext) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data())) {
    throw CryptoError("Failed to initialize encryption context");
  }

  Bytes out(plaintext.size() + CryptoEngine::TAG_SIZE);
  int length = 0;
  int total = 0;
  if (!plaintext.empty()) {
    if (!EVP_EncryptUpdate(ctx.get(), out.data(), &length, plaintext.data(), static_cast<int>(plaintext.size()))) {
      throw CryptoError("Encryption failed");
    }
    total = length;
  }
  if (!EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &length)) {
    throw CryptoError("Encryption finalization failed");
  }
  total += length;

  if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(CryptoEngine::TAG_SIZE),
                           out.data() + total)) {
    throw CryptoError("Failed to read authentication tag");
  }
  out.resize(static_cast<std::size_t>(total) + CryptoEngine::TAG_SIZE);
  return out;
}

// Input is ciphertext || tag
Bytes aead_open(const Bytes& key, const Bytes& nonce, const std::uint8_t* data, std::size_t size) {
  if (size < CryptoEngine::TAG_SIZE) {
    throw AuthenticationFailedError("missing authentication tag");
  }
  const std::size_t cipher_size = size - CryptoEngine::TAG_SIZE;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, key.data(), nonce.data())) {
    throw CryptoError("Failed to initialize decryption context");
  }

  Bytes out(cipher_size);
  int length = 0;
  int total = 0;
  if (cipher_size > 0) {
    if (!EVP_DecryptUpdate(ctx.get(), out.data(), &length, data, static_cast<int>(cipher_size))) {
      throw AuthenticationFailedError("decryption failed");
    }
    total = length;
  }

  Bytes tag(data + cipher_size, data + size);
  if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data())) {
    throw CryptoError("Failed to set authentication tag");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &length) <= 0) {
    OPENSSL_cleanse(out.data(), out.size());
    throw AuthenticationFailedError("integrity check failed");
  }
  total += length;
  out.resize(static_cast<std::size_t>(total));
  return out;
}

Bytes concat(const Bytes& a, const Bytes& b) {
  Bytes out;
  out.reserve(a.size() + b.size());
  out.insert(out.end(), a.begin(), a.end());
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

} // namespace

//==============================================
// KEY PAIRS
//==============================================

KeyPair KeyPair::generate() {
  auto key = generate_key(EVP_PKEY_X25519);
  return KeyPair{raw_public(key.get()), raw_private(key.get())};
}

KeyPair KeyPair::from_secret(const Bytes& secret_key) {
  if (secret_key.size() != CryptoEngine::KEY_SIZE) {
    throw InvalidKeyError("X25519 secret must be 32 bytes");
  }
  auto key = load_private(EVP_PKEY_X25519, secret_key);
  return KeyPair{raw_public(key.get()), secret_key};
}

SignKeyPair SignKeyPair::generate() {
  auto key = generate_key(EVP_PKEY_ED25519);
  return SignKeyPair{raw_public(key.get()), raw_private(key.get())};
}

SignKeyPair SignKeyPair::from_seed(const Bytes& seed) {
  if (seed.size() != CryptoEngine::KEY_SIZE) {
    throw InvalidKeyError("Ed25519 seed must be 32 bytes");
  }
  auto key = load_private(EVP_PKEY_ED25519, seed);
  return SignKeyPair{raw_public(key.get()), seed};
}

Bytes decode_key(const std::string& key_base64, std::size_t expected_size) {
  Bytes key;
  try {
    key = base64_decode(key_base64);
  } catch (const EncodingError& e) {
    throw InvalidKeyError(e.what());
  }
  if (key.size() != expected_size) {
    throw InvalidKeyError("expected " + std::to_string(expected_size) + " bytes, got " +
                          std::to_string(key.size()));
  }
  return key;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoEngine::CryptoEngine() {
  BOOST_LOG_TRIVIAL(info) << "Crypto engine: Generating local identity";
  keys_ = KeyPair::generate();
  sign_keys_ = SignKeyPair::generate();
  BOOST_LOG_TRIVIAL(debug) << "Crypto engine: Identity ready";
}

CryptoEngine::CryptoEngine(KeyPair keys, SignKeyPair sign_keys)
  : keys_(std::move(keys))
  , sign_keys_(std::move(sign_keys)) {
  if (keys_.public_key.size() != KEY_SIZE || keys_.secret_key.size() != KEY_SIZE ||
      sign_keys_.public_key.size() != KEY_SIZE || sign_keys_.seed.size() != KEY_SIZE) {
    throw InvalidKeyError("Persisted identity has wrong key sizes");
  }
  BOOST_LOG_TRIVIAL(info) << "Crypto engine: Loaded persisted identity";
}

//==============================================
// IDENTITY
//==============================================

void CryptoEngine::generate_identity() {
  auto keys = KeyPair::generate();
  auto sign_keys = SignKeyPair::generate();

  std::lock_guard<std::mutex> lock(identity_mutex_);
  keys_ = std::move(keys);
  sign_keys_ = std::move(sign_keys);
  BOOST_LOG_TRIVIAL(info) << "Crypto engine: Regenerated local identity";
}

std::string CryptoEngine::public_key_base64() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return base64_encode(keys_.public_key);
}

std::string CryptoEngine::signing_key_base64() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return base64_encode(sign_keys_.public_key);
}

KeyPair CryptoEngine::key_pair() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return keys_;
}

SignKeyPair CryptoEngine::sign_key_pair() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return sign_keys_;
}

//==============================================
// SHARED KEYS
//==============================================

void CryptoEngine::derive_shared_key(const std::string& device_id, const std::string& remote_public_key_base64) {
  if (device_id.empty()) {
    throw InvalidKeyError("Empty device id");
  }
  Bytes remote = decode_key(remote_public_key_base64, KEY_SIZE);
  Bytes secret = key_pair().secret_key;

  Bytes agreement = x25519_agree(secret, remote);
  Bytes key = hkdf_sha256(agreement, {}, SHARED_KEY_INFO);
  OPENSSL_cleanse(agreement.data(), agreement.size());
  OPENSSL_cleanse(secret.data(), secret.size());

  std::lock_guard<std::mutex> lock(shared_keys_mutex_);
  shared_keys_[device_id] = SharedKeyEntry{std::move(remote), std::move(key)};
  BOOST_LOG_TRIVIAL(info) << "Crypto engine: Derived shared key for device " << device_id;
}

bool CryptoEngine::has_shared_key(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(shared_keys_mutex_);
  return shared_keys_.count(device_id) > 0;
}

bool CryptoEngine::remove_shared_key(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(shared_keys_mutex_);
  auto it = shared_keys_.find(device_id);
  if (it == shared_keys_.end()) {
    return false;
  }
  OPENSSL_cleanse(it->second.key.data(), it->second.key.size());
  shared_keys_.erase(it);
  BOOST_LOG_TRIVIAL(debug) << "Crypto engine: Removed shared key for device " << device_id;
  return true;
}

std::size_t CryptoEngine::shared_key_count() const {
  std::lock_guard<std::mutex> lock(shared_keys_mutex_);
  return shared_keys_.size();
}

Bytes CryptoEngine::lookup_key(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(shared_keys_mutex_);
  auto it = shared_keys_.find(device_id);
  if (it == shared_keys_.end()) {
    throw NoSharedKeyError(device_id);
  }
  return it->second.key;
}

//==============================================
// SYMMETRIC ENCRYPTION
//==============================================

Bytes CryptoEngine::encrypt(const std::string& device_id, const Bytes& plaintext) const {
  Bytes key = lookup_key(device_id);
  Bytes nonce = random_bytes(NONCE_SIZE);

  Bytes sealed = aead_seal(key, nonce, plaintext);
  OPENSSL_cleanse(key.data(), key.size());
  return concat(nonce, sealed);
}

Bytes CryptoEngine::decrypt(const std::string& device_id, const Bytes& data) const {
  if (data.size() < NONCE_SIZE) {
    throw TooShortError(std::to_string(data.size()) + " bytes");
  }
  Bytes key = lookup_key(device_id);
  Bytes nonce(data.begin(), data.begin() + NONCE_SIZE);

  try {
    Bytes plaintext = aead_open(key, nonce, data.data() + NONCE_SIZE, data.size() - NONCE_SIZE);
    OPENSSL_cleanse(key.data(), key.size());
    return plaintext;
  } catch (const AuthenticationFailedError&) {
    OPENSSL_cleanse(key.data(), key.size());
    BOOST_LOG_TRIVIAL(warning) << "Crypto engine: Rejected message from device " << device_id;
    throw;
  }
}

//==============================================
// SIGNATURES
//==============================================

Bytes CryptoEngine::sign(const Bytes& data) const {
  auto key = load_private(EVP_PKEY_ED25519, sign_key_pair().seed);

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) <= 0) {
    throw CryptoError("Failed to initialize signing");
  }
  Bytes signature(SIGNATURE_SIZE);
  std::size_t length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, data.data(), data.size()) <= 0) {
    throw CryptoError("Signing failed");
  }
  signature.resize(length);
  return signature;
}

bool CryptoEngine::verify(const Bytes& signature, const Bytes& data,
                          const std::string& signer_public_key_base64) const {
  Bytes public_key = decode_key(signer_public_key_base64, KEY_SIZE);
  if (signature.size() != SIGNATURE_SIZE) {
    return false;
  }
  auto key = load_public(EVP_PKEY_ED25519, public_key);

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) <= 0) {
    throw CryptoError("Failed to initialize verification");
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), data.data(), data.size()) == 1;
}

//==============================================
// FIRST CONTACT
//==============================================

Bytes CryptoEngine::seal_for_first_contact(const std::string& recipient_public_key_base64,
                                           const Bytes& data) const {
  Bytes recipient = decode_key(recipient_public_key_base64, KEY_SIZE);
  KeyPair ephemeral = KeyPair::generate();

  Bytes agreement = x25519_agree(ephemeral.secret_key, recipient);
  Bytes binding = concat(ephemeral.public_key, recipient);
  Bytes key = hkdf_sha256(agreement, binding, SEALED_BOX_INFO);
  Bytes digest = sha256(binding);
  Bytes nonce(digest.begin(), digest.begin() + NONCE_SIZE);

  Bytes sealed = aead_seal(key, nonce, data);
  OPENSSL_cleanse(agreement.data(), agreement.size());
  OPENSSL_cleanse(key.data(), key.size());
  OPENSSL_cleanse(ephemeral.secret_key.data(), ephemeral.secret_key.size());
  return concat(ephemeral.public_key, sealed);
}

Bytes CryptoEngine::open_first_contact(const Bytes& sealed) const {
  if (sealed.size() < SEAL_OVERHEAD) {
    throw TooShortError("sealed box of " + std::to_string(sealed.size()) + " bytes");
  }
  KeyPair local = key_pair();
  Bytes ephemeral(sealed.begin(), sealed.begin() + KEY_SIZE);

  Bytes agreement = x25519_agree(local.secret_key, ephemeral);
  Bytes binding = concat(ephemeral, local.public_key);
  Bytes key = hkdf_sha256(agreement, binding, SEALED_BOX_INFO);
  Bytes digest = sha256(binding);
  Bytes nonce(digest.begin(), digest.begin() + NONCE_SIZE);
  OPENSSL_cleanse(agreement.data(), agreement.size());
  OPENSSL_cleanse(local.secret_key.data(), local.secret_key.size());

  try {
    Bytes plaintext = aead_open(key, nonce, sealed.data() + KEY_SIZE, sealed.size() - KEY_SIZE);
    OPENSSL_cleanse(key.data(), key.size());
    return plaintext;
  } catch (const AuthenticationFailedError&) {
    OPENSSL_cleanse(key.data(), key.size());
    throw;
  }
}

//==============================================
// RANDOMNESS
//==============================================

Bytes CryptoEngine::random_bytes(std::size_t length) {
  Bytes out(length);
  if (length > 0 && RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
    throw InitializationError("Random generator unavailable");
  }
  return out;
}

std::string CryptoEngine::generate_pin() {
  constexpr std::uint32_t range = 900000;
  // Largest multiple of range below 2^32, draws above it are rejected
  constexpr std::uint64_t limit = (std::uint64_t{1} << 32) / range * range;

  while (true) {
    Bytes raw = random_bytes(4);
    const std::uint64_t value = (std::uint64_t{raw[0]} << 24) | (std::uint64_t{raw[1]} << 16) |
                                (std::uint64_t{raw[2]} << 8) | std::uint64_t{raw[3]};
    if (value < limit) {
      return std::to_string(100000 + value % range);
    }
  }
}

} // namespace pasteall::crypto
