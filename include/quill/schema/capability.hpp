#pragma once

#include <quill/schema/enum_string.hpp>
#include <quill/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

// Schema type: capability.
// Delegation workflow: the actions a principal can hand to a relayer. Each
// capability owns one bit of a 256-bit scope mask.
namespace quill::schema {

enum class capability_t : uint8_t {
  claim = 0,
  snapshot = 1,
  attest = 2,
  backup = 3,
  release = 4
};

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"claim", capability_t::claim},
    std::pair<std::string_view, capability_t>{"snapshot",
                                              capability_t::snapshot},
    std::pair<std::string_view, capability_t>{"attest", capability_t::attest},
    std::pair<std::string_view, capability_t>{"backup", capability_t::backup},
    std::pair<std::string_view, capability_t>{"release",
                                              capability_t::release}};

template <>
inline std::optional<capability_t> try_from_string<capability_t>(
    const std::string_view value) {
  return from_string(value, kCapabilityMappings);
}

inline constexpr std::string_view to_string(const capability_t value) {
  return to_string(value, kCapabilityMappings).value_or("unknown");
}

/// Mask with only the bit of `value` set.
scope_mask_t scope_of(capability_t value);

/// The capability whose single bit is exactly `mask`; std::nullopt for zero,
/// multi-bit and unassigned masks.
std::optional<capability_t> capability_of(const scope_mask_t& mask);

/// Union of the bits of every listed capability.
scope_mask_t make_scope_mask(std::initializer_list<capability_t> values);

/// Reserved "every capability" sentinel (2^256 - 1).
///
/// Only this exact value acts as a wildcard; a mask with any bit cleared is
/// evaluated bit by bit.
const scope_mask_t& all_scopes();

bool is_all_scopes(const scope_mask_t& mask);

}  // namespace quill::schema
