#pragma once

#include <warden/schema/primitives.hpp>

#include <memory>
#include <optional>

#include <openssl/evp.h>

namespace warden::crypto {

/// ed25519 key pair of the local agent. Records this agent authors are signed
/// with it; the public half is the agent's identity.
class keypair final {
 public:
  static keypair generate();

  /// Rebuild from a 32-byte private seed; std::nullopt when OpenSSL refuses it.
  static std::optional<keypair> from_private_key(
      const warden::schema::bytes_view_t& seed);

  keypair(keypair&&) noexcept = default;
  keypair& operator=(keypair&&) noexcept = default;
  keypair(const keypair&) = delete;
  keypair& operator=(const keypair&) = delete;

  const warden::schema::agent_key_t& public_key() const { return public_key_; }
  warden::schema::bytes_t private_key() const;
  warden::schema::signature_t sign(
      const warden::schema::bytes_view_t& message) const;

 private:
  using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

  explicit keypair(evp_pkey_ptr key);

  evp_pkey_ptr key_;
  warden::schema::agent_key_t public_key_{};
};

}  // namespace warden::crypto
