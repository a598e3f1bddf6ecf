#pragma once

#include <quill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace quill::schema {

enum class error_code : uint32_t {
  // invalid input
  zero_principal = 1,
  zero_relayer = 2,
  zero_context = 3,
  zero_identifier = 4,
  zero_identity = 5,
  empty_manifest = 6,
  bad_expiry = 7,
  empty_snapshot_refs = 8,
  invalid_status = 9,
  self_supersession = 10,
  // signatures
  signature_expired = 20,
  bad_signer = 21,
  // preconditions
  release_exists = 30,
  release_missing = 31,
  release_not_pending = 32,
  release_revoked = 33,
  release_not_revoked = 34,
  release_already_superseded = 35,
  project_mismatch = 36,
  replacement_revoked = 37,
  snapshot_missing = 38,
  author_not_member = 39,
  governance_not_member = 40,
  authority_exists = 41,
  authority_missing = 42,
  cannot_remove_authority = 43,
  authority_cannot_leave = 44,
  repository_claimed = 45,
  repository_missing = 46,
  repository_wrong_context = 47,
  owner_not_member = 48,
  no_change = 49,
  duplicate_root = 50,
  author_not_owner = 51,
  // standing
  not_authorized = 60,
  not_governance = 61,
  author_mismatch = 62,
};

enum class error_category : uint8_t {
  none = 0,
  invalid_input = 1,
  signature_invalid = 2,
  signature_expired = 3,
  precondition_failed = 4,
  unauthorized = 5
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"zero principal",
                                            error_code::zero_principal},
    std::pair<std::string_view, error_code>{"zero relayer",
                                            error_code::zero_relayer},
    std::pair<std::string_view, error_code>{"zero context",
                                            error_code::zero_context},
    std::pair<std::string_view, error_code>{"zero identifier",
                                            error_code::zero_identifier},
    std::pair<std::string_view, error_code>{"zero identity",
                                            error_code::zero_identity},
    std::pair<std::string_view, error_code>{"empty manifest",
                                            error_code::empty_manifest},
    std::pair<std::string_view, error_code>{"bad expiry",
                                            error_code::bad_expiry},
    std::pair<std::string_view, error_code>{"no snapshots",
                                            error_code::empty_snapshot_refs},
    std::pair<std::string_view, error_code>{"invalid status",
                                            error_code::invalid_status},
    std::pair<std::string_view, error_code>{"cannot supersede itself",
                                            error_code::self_supersession},
    std::pair<std::string_view, error_code>{"sig expired",
                                            error_code::signature_expired},
    std::pair<std::string_view, error_code>{"bad signer",
                                            error_code::bad_signer},
    std::pair<std::string_view, error_code>{"release exists",
                                            error_code::release_exists},
    std::pair<std::string_view, error_code>{"release not found",
                                            error_code::release_missing},
    std::pair<std::string_view, error_code>{"not in pending status",
                                            error_code::release_not_pending},
    std::pair<std::string_view, error_code>{"release revoked",
                                            error_code::release_revoked},
    std::pair<std::string_view, error_code>{"old release must be revoked",
                                            error_code::release_not_revoked},
    std::pair<std::string_view, error_code>{
        "already superseded", error_code::release_already_superseded},
    std::pair<std::string_view, error_code>{"project mismatch",
                                            error_code::project_mismatch},
    std::pair<std::string_view, error_code>{"new release revoked",
                                            error_code::replacement_revoked},
    std::pair<std::string_view, error_code>{"snapshot not found",
                                            error_code::snapshot_missing},
    std::pair<std::string_view, error_code>{"author not member",
                                            error_code::author_not_member},
    std::pair<std::string_view, error_code>{"governance not member",
                                            error_code::governance_not_member},
    std::pair<std::string_view, error_code>{"authority already set",
                                            error_code::authority_exists},
    std::pair<std::string_view, error_code>{"authority not set",
                                            error_code::authority_missing},
    std::pair<std::string_view, error_code>{
        "cannot remove authority", error_code::cannot_remove_authority},
    std::pair<std::string_view, error_code>{
        "authority cannot leave", error_code::authority_cannot_leave},
    std::pair<std::string_view, error_code>{"already claimed",
                                            error_code::repository_claimed},
    std::pair<std::string_view, error_code>{"repo not claimed",
                                            error_code::repository_missing},
    std::pair<std::string_view, error_code>{
        "repo wrong context", error_code::repository_wrong_context},
    std::pair<std::string_view, error_code>{"owner not member",
                                            error_code::owner_not_member},
    std::pair<std::string_view, error_code>{"no change",
                                            error_code::no_change},
    std::pair<std::string_view, error_code>{"duplicate root",
                                            error_code::duplicate_root},
    std::pair<std::string_view, error_code>{"author not owner",
                                            error_code::author_not_owner},
    std::pair<std::string_view, error_code>{"not authorized",
                                            error_code::not_authorized},
    std::pair<std::string_view, error_code>{"not governance",
                                            error_code::not_governance},
    std::pair<std::string_view, error_code>{"author mismatch",
                                            error_code::author_mismatch}};

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category>{"none", error_category::none},
    std::pair<std::string_view, error_category>{
        "invalid_input", error_category::invalid_input},
    std::pair<std::string_view, error_category>{
        "signature_invalid", error_category::signature_invalid},
    std::pair<std::string_view, error_category>{
        "signature_expired", error_category::signature_expired},
    std::pair<std::string_view, error_category>{
        "precondition_failed", error_category::precondition_failed},
    std::pair<std::string_view, error_category>{
        "unauthorized", error_category::unauthorized}};

/// Human readable condition carried in `operation_result_t::log`.
inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown error");
}

inline constexpr std::string_view to_string(const error_category value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

/// Every error code belongs to exactly one category.
error_category category_of(error_code value);

/// Category of a raw result code; `0` is success.
error_category category_of_code(uint32_t code);

}  // namespace quill::schema
