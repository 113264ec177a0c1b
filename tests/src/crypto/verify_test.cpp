#include <gtest/gtest.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/keypair.hpp>
#include <warden/crypto/verify.hpp>

#include <vector>

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto key = warden::crypto::keypair::generate();
  auto message = std::vector<uint8_t>{'w', 'a', 'r', 'd', 'e', 'n'};
  auto signature =
      key.sign(warden::schema::bytes_view_t{message.data(), message.size()});

  EXPECT_TRUE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()},
      key.public_key(), signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()},
      key.public_key(), signature));
}

TEST(crypto_verify, rejects_signature_from_another_agent) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto alice = warden::crypto::keypair::generate();
  auto bob = warden::crypto::keypair::generate();
  auto digest = warden::blake3::hash(std::string_view{"status"});
  auto signature = alice.sign(warden::schema::bytes_view_t{digest});

  EXPECT_FALSE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{digest}, bob.public_key(), signature));
}

TEST(crypto_verify, keypair_restores_from_private_seed) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto original = warden::crypto::keypair::generate();
  auto seed = original.private_key();
  ASSERT_EQ(seed.size(), 32u);

  auto restored = warden::crypto::keypair::from_private_key(
      warden::schema::make_bytes_view(seed));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->public_key(), original.public_key());

  auto short_seed = warden::schema::bytes_t(16, 0x01);
  EXPECT_FALSE(warden::crypto::keypair::from_private_key(
                   warden::schema::make_bytes_view(short_seed))
                   .has_value());
}

TEST(crypto_verify, blake3_hash_is_deterministic) {
  auto first = warden::blake3::hash(std::string_view{"abc"});
  auto second = warden::blake3::hash(std::string_view{"abc"});
  auto other = warden::blake3::hash(std::string_view{"abd"});
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other);
  // Published BLAKE3 test vector for the empty input.
  EXPECT_EQ(warden::schema::to_hex(warden::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}
