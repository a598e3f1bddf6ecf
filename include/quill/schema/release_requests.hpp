#pragma once

#include <quill/schema/governance_status.hpp>
#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace quill::schema {

template <uint16_t Version>
struct anchor_release;

template <>
struct anchor_release<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  release_id_t release_id{};
  context_id_t context{};
  std::string manifest_ref;
  std::string name;
  address_t author{};
  address_t governance_authority{};
  std::vector<snapshot_ref_t> snapshots;
};

template <uint16_t Version>
struct set_governance_status;

template <>
struct set_governance_status<1> final {
  uint16_t version{1};
  release_id_t release_id{};
  governance_status_t status{governance_status_t::pending};
};

template <uint16_t Version>
struct revoke_release;

template <>
struct revoke_release<1> final {
  uint16_t version{1};
  release_id_t release_id{};
  address_t author{};
};

template <uint16_t Version>
struct supersede_release;

template <>
struct supersede_release<1> final {
  uint16_t version{1};
  release_id_t old_release_id{};
  release_id_t new_release_id{};
  address_t author{};
};

template <uint16_t Version>
struct set_dao_executor;

template <>
struct set_dao_executor<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t author{};
  address_t executor{};
};

using anchor_release_t = anchor_release<1>;
using set_governance_status_t = set_governance_status<1>;
using revoke_release_t = revoke_release<1>;
using supersede_release_t = supersede_release<1>;
using set_dao_executor_t = set_dao_executor<1>;

}  // namespace quill::schema
