#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace quill::schema {

template <uint16_t Version>
struct claim_repository;

template <>
struct claim_repository<1> final {
  uint16_t version{1};
  repository_id_t repository_id{};
  context_id_t context{};
  std::string metadata;
  address_t owner{};
};

template <uint16_t Version>
struct transfer_repository;

template <>
struct transfer_repository<1> final {
  uint16_t version{1};
  repository_id_t repository_id{};
  address_t new_owner{};
  context_id_t new_context{};
};

template <uint16_t Version>
struct create_snapshot;

template <>
struct create_snapshot<1> final {
  uint16_t version{1};
  repository_id_t repository_id{};
  context_id_t context{};
  hash32_t commit_hash{};
  hash32_t merkle_root{};
  std::string manifest_ref;
  address_t author{};
};

using claim_repository_t = claim_repository<1>;
using transfer_repository_t = transfer_repository<1>;
using create_snapshot_t = create_snapshot<1>;

}  // namespace quill::schema
