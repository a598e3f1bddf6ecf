#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>

// Schema type: signed authorizations.
// Off-line payloads a principal or workspace authority signs so that a
// relayer can submit the request for them. Field order is the signing order.
namespace quill::schema {

template <uint16_t Version>
struct delegate_authorization;

template <>
struct delegate_authorization<1> final {
  uint16_t version{1};
  address_t principal{};
  address_t relayer{};
  context_id_t context{};
  scope_mask_t scope_mask{};
  uint64_t nonce{};
  timestamp_seconds_t expiry{};
  timestamp_seconds_t deadline{};
};

template <uint16_t Version>
struct revoke_authorization;

template <>
struct revoke_authorization<1> final {
  uint16_t version{1};
  address_t principal{};
  address_t relayer{};
  context_id_t context{};
  uint64_t nonce{};
  timestamp_seconds_t deadline{};
};

template <uint16_t Version>
struct set_authority_authorization;

template <>
struct set_authority_authorization<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t authority{};
  uint64_t nonce{};
  timestamp_seconds_t deadline{};
};

template <uint16_t Version>
struct set_member_authorization;

template <>
struct set_member_authorization<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t member{};
  bool is_member{};
  uint64_t nonce{};
  timestamp_seconds_t deadline{};
};

using delegate_authorization_t = delegate_authorization<1>;
using revoke_authorization_t = revoke_authorization<1>;
using set_authority_authorization_t = set_authority_authorization<1>;
using set_member_authorization_t = set_member_authorization<1>;

}  // namespace quill::schema
