#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: snapshot state.
// Snapshot workflow: one source snapshot of a repository, addressed by its
// position in the repository's list and by its merkle root.
namespace quill::schema {

template <uint16_t Version>
struct snapshot_state;

template <>
struct snapshot_state<1> final {
  uint16_t version{1};
  repository_id_t repository_id{};
  uint64_t index{};
  context_id_t context{};
  address_t author{};
  hash32_t commit_hash{};
  hash32_t merkle_root{};
  std::string manifest_ref;
  timestamp_seconds_t created_at{};
};

using snapshot_state_t = snapshot_state<1>;

}  // namespace quill::schema
