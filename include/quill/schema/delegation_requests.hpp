#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>

namespace quill::schema {

template <uint16_t Version>
struct register_grant;

/// Relayed registration of a grant, signed by the principal.
template <>
struct register_grant<1> final {
  uint16_t version{1};
  address_t principal{};
  address_t relayer{};
  context_id_t context{};
  scope_mask_t scope_mask{};
  timestamp_seconds_t expiry{};
  timestamp_seconds_t deadline{};
  signature_t signature{};
};

template <uint16_t Version>
struct revoke_grant;

/// Direct revocation; the sender is the principal.
template <>
struct revoke_grant<1> final {
  uint16_t version{1};
  address_t relayer{};
  context_id_t context{};
};

template <uint16_t Version>
struct revoke_grant_with_sig;

template <>
struct revoke_grant_with_sig<1> final {
  uint16_t version{1};
  address_t principal{};
  address_t relayer{};
  context_id_t context{};
  timestamp_seconds_t deadline{};
  signature_t signature{};
};

using register_grant_t = register_grant<1>;
using revoke_grant_t = revoke_grant<1>;
using revoke_grant_with_sig_t = revoke_grant_with_sig<1>;

}  // namespace quill::schema
