#pragma once

#include <warden/schema/primitives.hpp>

#include <functional>

namespace warden::crypto {

using signature_verifier_t =
    std::function<bool(const warden::schema::bytes_view_t& message,
                       const warden::schema::agent_key_t& author,
                       const warden::schema::signature_t& signature)>;

bool available();

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::agent_key_t& author,
                      const warden::schema::signature_t& signature);

}  // namespace warden::crypto
