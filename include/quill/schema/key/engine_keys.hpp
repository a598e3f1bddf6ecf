#pragma once

#include <quill/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Provenance workflow: canonical key prefixes and key codecs for delegation,
// workspace, repository, snapshot and release state plus the event log.
namespace quill::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kDelegationNonceKeyPrefix{
    "SYS|STATE|DELEGATION_NONCE|"};
inline constexpr std::string_view kGrantKeyPrefix{"SYS|STATE|GRANT|"};
inline constexpr std::string_view kWorkspaceKeyPrefix{"SYS|STATE|WORKSPACE|"};
inline constexpr std::string_view kWorkspaceMemberKeyPrefix{
    "SYS|STATE|WORKSPACE_MEMBER|"};
inline constexpr std::string_view kWorkspaceNonceKeyPrefix{
    "SYS|STATE|WORKSPACE_NONCE|"};
inline constexpr std::string_view kRepositoryKeyPrefix{
    "SYS|STATE|REPOSITORY|"};
inline constexpr std::string_view kOwnerRepositoryKeyPrefix{
    "SYS|STATE|OWNER_REPOSITORY|"};
inline constexpr std::string_view kSnapshotKeyPrefix{"SYS|STATE|SNAPSHOT|"};
inline constexpr std::string_view kSnapshotRootKeyPrefix{
    "SYS|STATE|SNAPSHOT_ROOT|"};
inline constexpr std::string_view kSnapshotCountKeyPrefix{
    "SYS|STATE|SNAPSHOT_COUNT|"};
inline constexpr std::string_view kReleaseKeyPrefix{"SYS|STATE|RELEASE|"};
inline constexpr std::string_view kProjectReleaseKeyPrefix{
    "SYS|STATE|PROJECT_RELEASE|"};
inline constexpr std::string_view kProjectReleaseCountKeyPrefix{
    "SYS|STATE|PROJECT_RELEASE_COUNT|"};
inline constexpr std::string_view kDaoExecutorKeyPrefix{
    "SYS|STATE|DAO_EXECUTOR|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 17> kEngineKeyspaces{
    kStatePrefix,
    kDelegationNonceKeyPrefix,
    kGrantKeyPrefix,
    kWorkspaceKeyPrefix,
    kWorkspaceMemberKeyPrefix,
    kWorkspaceNonceKeyPrefix,
    kRepositoryKeyPrefix,
    kOwnerRepositoryKeyPrefix,
    kSnapshotKeyPrefix,
    kSnapshotRootKeyPrefix,
    kSnapshotCountKeyPrefix,
    kReleaseKeyPrefix,
    kProjectReleaseKeyPrefix,
    kProjectReleaseCountKeyPrefix,
    kDaoExecutorKeyPrefix,
    kEventSeqKeyPrefix,
    kEventPrefix};

/// Raw prefix bytes followed by the already encoded identifier.
quill::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const quill::schema::bytes_t& id);

quill::schema::bytes_t make_delegation_nonce_key(
    const quill::schema::address_t& principal);
quill::schema::bytes_t make_grant_key(
    const quill::schema::address_t& principal,
    const quill::schema::address_t& relayer,
    const quill::schema::context_id_t& context);

quill::schema::bytes_t make_workspace_key(
    const quill::schema::context_id_t& context);
quill::schema::bytes_t make_workspace_member_key(
    const quill::schema::context_id_t& context,
    const quill::schema::address_t& member);
quill::schema::bytes_t make_workspace_nonce_key(
    const quill::schema::address_t& authority);

quill::schema::bytes_t make_repository_key(
    const quill::schema::repository_id_t& repository_id);
quill::schema::bytes_t make_owner_repository_key(
    const quill::schema::address_t& owner,
    const quill::schema::repository_id_t& repository_id);
quill::schema::bytes_t make_owner_repository_prefix_key(
    const quill::schema::address_t& owner);

quill::schema::bytes_t make_snapshot_key(
    const quill::schema::repository_id_t& repository_id,
    uint64_t index);
quill::schema::bytes_t make_snapshot_root_key(
    const quill::schema::repository_id_t& repository_id,
    const quill::schema::hash32_t& merkle_root);
quill::schema::bytes_t make_snapshot_count_key(
    const quill::schema::repository_id_t& repository_id);

quill::schema::bytes_t make_release_key(
    const quill::schema::release_id_t& release_id);
quill::schema::bytes_t make_project_release_key(
    const quill::schema::project_id_t& project_id,
    uint64_t index);
quill::schema::bytes_t make_project_release_count_key(
    const quill::schema::project_id_t& project_id);
quill::schema::bytes_t make_dao_executor_key(
    const quill::schema::context_id_t& context);

quill::schema::bytes_t make_event_sequence_key();
quill::schema::bytes_t make_event_key(uint64_t event_id);

std::optional<uint64_t> parse_event_key(const quill::schema::bytes_view_t& key);

}  // namespace quill::schema::key
