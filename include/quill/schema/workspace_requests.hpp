#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>

namespace quill::schema {

template <uint16_t Version>
struct init_authority;

template <>
struct init_authority<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t authority{};
};

template <uint16_t Version>
struct set_authority_with_sig;

template <>
struct set_authority_with_sig<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t new_authority{};
  timestamp_seconds_t deadline{};
  signature_t signature{};
};

template <uint16_t Version>
struct set_member_with_sig;

template <>
struct set_member_with_sig<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t member{};
  bool is_member{};
  timestamp_seconds_t deadline{};
  signature_t signature{};
};

template <uint16_t Version>
struct leave_workspace;

template <>
struct leave_workspace<1> final {
  uint16_t version{1};
  context_id_t context{};
};

using init_authority_t = init_authority<1>;
using set_authority_with_sig_t = set_authority_with_sig<1>;
using set_member_with_sig_t = set_member_with_sig<1>;
using leave_workspace_t = leave_workspace<1>;

}  // namespace quill::schema
