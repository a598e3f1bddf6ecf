#pragma once

#include <quill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: governance status.
// Release workflow: pending until the governance authority (or the DAO
// executor) decides; accepted and rejected are terminal.
namespace quill::schema {

enum class governance_status_t : uint8_t {
  pending = 0,
  accepted = 1,
  rejected = 2
};

inline constexpr auto kGovernanceStatusMappings =
    std::array{std::pair<std::string_view, governance_status_t>{
                   "pending", governance_status_t::pending},
               std::pair<std::string_view, governance_status_t>{
                   "accepted", governance_status_t::accepted},
               std::pair<std::string_view, governance_status_t>{
                   "rejected", governance_status_t::rejected}};

template <>
inline std::optional<governance_status_t> try_from_string<governance_status_t>(
    const std::string_view value) {
  return from_string(value, kGovernanceStatusMappings);
}

inline constexpr std::string_view to_string(const governance_status_t value) {
  return to_string(value, kGovernanceStatusMappings).value_or("unknown");
}

}  // namespace quill::schema
