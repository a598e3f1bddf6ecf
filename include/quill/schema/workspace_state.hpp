#pragma once

#include <quill/schema/primitives.hpp>

#include <cstdint>

// Schema type: workspace state.
// Membership workflow: the single signing authority of a context. Member
// flags and authority nonces live under their own keys.
namespace quill::schema {

template <uint16_t Version>
struct workspace_state;

template <>
struct workspace_state<1> final {
  uint16_t version{1};
  context_id_t context{};
  address_t authority{};
};

using workspace_state_t = workspace_state<1>;

}  // namespace quill::schema
