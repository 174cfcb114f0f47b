#include <gtest/gtest.h>
#include <set>
#include <string>
#include "crypto/base64.hpp"
#include "crypto/crypto_engine.hpp"
#include "test_utils.hpp"

using namespace pasteall::crypto;

class CryptoEngineTest : public ::testing::Test {
protected:
  CryptoEngine alice;
  CryptoEngine bob;

  void SetUp() override {
    pasteall::test::init_logging();
  }

  void pair_engines() {
    alice.derive_shared_key("bob", bob.public_key_base64());
    bob.derive_shared_key("alice", alice.public_key_base64());
  }

  static Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
  }
};

TEST_F(CryptoEngineTest, PublicKeysAreBase64OfKeySize) {
  EXPECT_EQ(base64_decode(alice.public_key_base64()).size(), CryptoEngine::KEY_SIZE);
  EXPECT_EQ(base64_decode(alice.signing_key_base64()).size(), CryptoEngine::KEY_SIZE);
  EXPECT_NE(alice.public_key_base64(), bob.public_key_base64());
}

TEST_F(CryptoEngineTest, EncryptDecryptBetweenPairedEngines) {
  pair_engines();
  const Bytes message = to_bytes("the quick brown fox");

  const Bytes sealed = alice.encrypt("bob", message);
  EXPECT_EQ(sealed.size(), message.size() + CryptoEngine::NONCE_SIZE + CryptoEngine::TAG_SIZE);
  EXPECT_EQ(bob.decrypt("alice", sealed), message);
}

TEST_F(CryptoEngineTest, EmptyPlaintextRoundTrips) {
  pair_engines();
  EXPECT_TRUE(bob.decrypt("alice", alice.encrypt("bob", {})).empty());
}

TEST_F(CryptoEngineTest, FreshNoncePerEncryption) {
  pair_engines();
  const Bytes message = to_bytes("same input");
  EXPECT_NE(alice.encrypt("bob", message), alice.encrypt("bob", message));
}

TEST_F(CryptoEngineTest, UnknownDeviceHasNoSharedKey) {
  EXPECT_THROW(alice.encrypt("nobody", to_bytes("x")), NoSharedKeyError);
  EXPECT_THROW(alice.decrypt("nobody", Bytes(64, 0)), NoSharedKeyError);
}

TEST_F(CryptoEngineTest, ShortCiphertextIsRejectedBeforeKeyLookup) {
  EXPECT_THROW(alice.decrypt("nobody", Bytes(CryptoEngine::NONCE_SIZE - 1, 0)), TooShortError);
}

TEST_F(CryptoEngineTest, TamperedCiphertextFailsAuthentication) {
  pair_engines();
  Bytes sealed = alice.encrypt("bob", to_bytes("do not touch"));
  sealed[CryptoEngine::NONCE_SIZE] ^= 0x01;
  EXPECT_THROW(bob.decrypt("alice", sealed), AuthenticationFailedError);
}

TEST_F(CryptoEngineTest, SharedKeyBookkeeping) {
  EXPECT_FALSE(alice.has_shared_key("bob"));
  pair_engines();
  EXPECT_TRUE(alice.has_shared_key("bob"));
  EXPECT_EQ(alice.shared_key_count(), 1u);

  EXPECT_TRUE(alice.remove_shared_key("bob"));
  EXPECT_FALSE(alice.remove_shared_key("bob"));
  EXPECT_THROW(alice.encrypt("bob", to_bytes("x")), NoSharedKeyError);
}

TEST_F(CryptoEngineTest, RederivingReplacesKey) {
  pair_engines();
  CryptoEngine carol;
  alice.derive_shared_key("bob", carol.public_key_base64());
  EXPECT_THROW(bob.decrypt("alice", alice.encrypt("bob", to_bytes("x"))), AuthenticationFailedError);
}

TEST_F(CryptoEngineTest, MalformedRemoteKeyIsRejected) {
  EXPECT_THROW(alice.derive_shared_key("bob", "not base64!"), InvalidKeyError);
  EXPECT_THROW(alice.derive_shared_key("bob", base64_encode(Bytes(16, 1))), InvalidKeyError);
  EXPECT_FALSE(alice.has_shared_key("bob"));
}

TEST_F(CryptoEngineTest, SignAndVerify) {
  const Bytes data = to_bytes("device-id" "nonce");
  const Bytes signature = alice.sign(data);
  ASSERT_EQ(signature.size(), CryptoEngine::SIGNATURE_SIZE);
  EXPECT_TRUE(bob.verify(signature, data, alice.signing_key_base64()));
  EXPECT_FALSE(bob.verify(signature, data, bob.signing_key_base64()));
}

TEST_F(CryptoEngineTest, AnyFlippedByteFailsVerification) {
  const Bytes data = to_bytes("payload to sign");
  const Bytes signature = alice.sign(data);

  for (std::size_t i = 0; i < data.size(); ++i) {
    Bytes altered = data;
    altered[i] ^= 0x80;
    EXPECT_FALSE(alice.verify(signature, altered, alice.signing_key_base64())) << "data byte " << i;
  }
  for (std::size_t i = 0; i < signature.size(); ++i) {
    Bytes altered = signature;
    altered[i] ^= 0x80;
    EXPECT_FALSE(alice.verify(altered, data, alice.signing_key_base64())) << "signature byte " << i;
  }
}

TEST_F(CryptoEngineTest, WrongLengthSignatureDoesNotVerify) {
  EXPECT_FALSE(alice.verify(Bytes(10, 0), to_bytes("x"), alice.signing_key_base64()));
}

TEST_F(CryptoEngineTest, SealedBoxOpensOnlyForRecipient) {
  const Bytes pin = to_bytes("123456");
  const Bytes sealed = alice.seal_for_first_contact(bob.public_key_base64(), pin);
  EXPECT_EQ(sealed.size(), pin.size() + CryptoEngine::SEAL_OVERHEAD);
  EXPECT_EQ(bob.open_first_contact(sealed), pin);

  CryptoEngine eve;
  EXPECT_THROW(eve.open_first_contact(sealed), AuthenticationFailedError);
  EXPECT_THROW(bob.open_first_contact(Bytes(8, 0)), TooShortError);
}

TEST_F(CryptoEngineTest, IdentityRestoredFromSecrets) {
  const KeyPair keys = alice.key_pair();
  const SignKeyPair sign_keys = alice.sign_key_pair();

  CryptoEngine restored(KeyPair::from_secret(keys.secret_key), SignKeyPair::from_seed(sign_keys.seed));
  EXPECT_EQ(restored.public_key_base64(), alice.public_key_base64());
  EXPECT_EQ(restored.signing_key_base64(), alice.signing_key_base64());

  const Bytes data = to_bytes("hello");
  EXPECT_TRUE(bob.verify(restored.sign(data), data, alice.signing_key_base64()));
}

TEST_F(CryptoEngineTest, GeneratePinIsSixDigits) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const std::string pin = CryptoEngine::generate_pin();
    ASSERT_EQ(pin.size(), 6u);
    for (char c : pin) {
      ASSERT_TRUE(c >= '0' && c <= '9') << pin;
    }
    const int value = std::stoi(pin);
    ASSERT_GE(value, 100000);
    ASSERT_LE(value, 999999);
    seen.insert(pin);
  }
  EXPECT_GT(seen.size(), 900u);
}

TEST(Base64Test, KnownVectors) {
  EXPECT_EQ(base64_encode(std::string("")), "");
  EXPECT_EQ(base64_encode(std::string("f")), "Zg==");
  EXPECT_EQ(base64_encode(std::string("fo")), "Zm8=");
  EXPECT_EQ(base64_encode(std::string("foobar")), "Zm9vYmFy");

  const auto decoded = base64_decode("Zm9vYg==");
  EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "foob");
}

TEST(Base64Test, MalformedInputThrows) {
  EXPECT_THROW(base64_decode("abc"), EncodingError);
  EXPECT_THROW(base64_decode("ab$d"), EncodingError);
  EXPECT_THROW(base64_decode("a==b"), EncodingError);
}
