#pragma once

#include <spdlog/spdlog.h>
#include <quill/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace quill::execution {

/// Recover the address that signed `digest`, or std::nullopt when the
/// signature does not resolve to any key.
using signer_recovery_t = std::function<std::optional<quill::schema::address_t>(
    const quill::schema::hash32_t& digest,
    const quill::schema::signature_t& signature)>;

/// True when `signature` over `digest` recovers to `expected`.
inline bool signed_by(const signer_recovery_t& recover_signer,
                      const quill::schema::hash32_t& digest,
                      const quill::schema::signature_t& signature,
                      const quill::schema::address_t& expected) {
  if (!recover_signer) {
    spdlog::error("No signer recovery installed; rejecting signature");
    return false;
  }
  auto signer = recover_signer(digest, signature);
  return signer.has_value() && signer.value() == expected;
}

}  // namespace quill::execution
