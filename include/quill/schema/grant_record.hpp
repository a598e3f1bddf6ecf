#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>

// Schema type: grant record.
// Delegation workflow: capability set a principal extends to a relayer inside
// one context. Keyed by (principal, relayer, context); `expiry == 0` means no
// grant exists.
namespace quill::schema {

template <uint16_t Version>
struct grant_record;

template <>
struct grant_record<1> final {
  uint16_t version{1};
  address_t principal{};
  address_t relayer{};
  context_id_t context{};
  scope_mask_t scope_mask{};
  timestamp_seconds_t expiry{};
};

using grant_record_t = grant_record<1>;

}  // namespace quill::schema
