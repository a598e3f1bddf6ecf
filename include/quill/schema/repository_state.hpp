#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: repository state.
// Claim workflow: current owner and workspace context of a claimed repository.
namespace quill::schema {

template <uint16_t Version>
struct repository_state;

template <>
struct repository_state<1> final {
  uint16_t version{1};
  repository_id_t repository_id{};
  address_t owner{};
  context_id_t context{};
  std::string metadata;
  timestamp_seconds_t claimed_at{};
};

using repository_state_t = repository_state<1>;

}  // namespace quill::schema
