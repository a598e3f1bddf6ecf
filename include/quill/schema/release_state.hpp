#pragma once

#include <quill/schema/governance_status.hpp>
#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: release state.
// Release workflow: immutable identity of an anchored release plus its
// governance status, revocation flag and supersession link.
namespace quill::schema {

template <uint16_t Version>
struct release_state;

template <>
struct release_state<1> final {
  uint16_t version{1};
  release_id_t release_id{};
  project_id_t project_id{};
  context_id_t context{};
  std::string manifest_ref;
  std::string name;
  timestamp_seconds_t created_at{};
  address_t author{};
  address_t governance_authority{};
  std::vector<snapshot_ref_t> snapshots;
  governance_status_t status{governance_status_t::pending};
  bool revoked{};
  std::optional<release_id_t> superseded_by;
  std::optional<timestamp_seconds_t> status_timestamp;
  std::optional<address_t> status_author;
};

using release_state_t = release_state<1>;

}  // namespace quill::schema
