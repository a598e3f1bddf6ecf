#include <quill/schema/key/engine_keys.hpp>

#include <quill/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace quill::schema::key {

namespace {

using key_encoder_t = quill::schema::encoding::encoder<
    quill::schema::encoding::scale_encoder_tag>;

}  // namespace

quill::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const quill::schema::bytes_t& id) {
  auto key = quill::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

quill::schema::bytes_t make_delegation_nonce_key(
    const quill::schema::address_t& principal) {
  return make_prefixed_key(kDelegationNonceKeyPrefix,
                           key_encoder_t{}.encode(principal));
}

quill::schema::bytes_t make_grant_key(
    const quill::schema::address_t& principal,
    const quill::schema::address_t& relayer,
    const quill::schema::context_id_t& context) {
  return make_prefixed_key(
      kGrantKeyPrefix,
      key_encoder_t{}.encode(std::tuple{principal, relayer, context}));
}

quill::schema::bytes_t make_workspace_key(
    const quill::schema::context_id_t& context) {
  return make_prefixed_key(kWorkspaceKeyPrefix,
                           key_encoder_t{}.encode(context));
}

quill::schema::bytes_t make_workspace_member_key(
    const quill::schema::context_id_t& context,
    const quill::schema::address_t& member) {
  return make_prefixed_key(kWorkspaceMemberKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{context, member}));
}

quill::schema::bytes_t make_workspace_nonce_key(
    const quill::schema::address_t& authority) {
  return make_prefixed_key(kWorkspaceNonceKeyPrefix,
                           key_encoder_t{}.encode(authority));
}

quill::schema::bytes_t make_repository_key(
    const quill::schema::repository_id_t& repository_id) {
  return make_prefixed_key(kRepositoryKeyPrefix,
                           key_encoder_t{}.encode(repository_id));
}

quill::schema::bytes_t make_owner_repository_key(
    const quill::schema::address_t& owner,
    const quill::schema::repository_id_t& repository_id) {
  return make_prefixed_key(
      kOwnerRepositoryKeyPrefix,
      key_encoder_t{}.encode(std::tuple{owner, repository_id}));
}

quill::schema::bytes_t make_owner_repository_prefix_key(
    const quill::schema::address_t& owner) {
  return make_prefixed_key(kOwnerRepositoryKeyPrefix,
                           key_encoder_t{}.encode(owner));
}

quill::schema::bytes_t make_snapshot_key(
    const quill::schema::repository_id_t& repository_id,
    uint64_t index) {
  return make_prefixed_key(kSnapshotKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{repository_id,
                                                             index}));
}

quill::schema::bytes_t make_snapshot_root_key(
    const quill::schema::repository_id_t& repository_id,
    const quill::schema::hash32_t& merkle_root) {
  return make_prefixed_key(
      kSnapshotRootKeyPrefix,
      key_encoder_t{}.encode(std::tuple{repository_id, merkle_root}));
}

quill::schema::bytes_t make_snapshot_count_key(
    const quill::schema::repository_id_t& repository_id) {
  return make_prefixed_key(kSnapshotCountKeyPrefix,
                           key_encoder_t{}.encode(repository_id));
}

quill::schema::bytes_t make_release_key(
    const quill::schema::release_id_t& release_id) {
  return make_prefixed_key(kReleaseKeyPrefix,
                           key_encoder_t{}.encode(release_id));
}

quill::schema::bytes_t make_project_release_key(
    const quill::schema::project_id_t& project_id,
    uint64_t index) {
  return make_prefixed_key(kProjectReleaseKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{project_id,
                                                             index}));
}

quill::schema::bytes_t make_project_release_count_key(
    const quill::schema::project_id_t& project_id) {
  return make_prefixed_key(kProjectReleaseCountKeyPrefix,
                           key_encoder_t{}.encode(project_id));
}

quill::schema::bytes_t make_dao_executor_key(
    const quill::schema::context_id_t& context) {
  return make_prefixed_key(kDaoExecutorKeyPrefix,
                           key_encoder_t{}.encode(context));
}

quill::schema::bytes_t make_event_sequence_key() {
  return make_prefixed_key(kEventSeqKeyPrefix, quill::schema::make_bytes(
                                                   std::string_view{"NEXT"}));
}

quill::schema::bytes_t make_event_key(uint64_t event_id) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(event_id));
}

std::optional<uint64_t> parse_event_key(
    const quill::schema::bytes_view_t& key) {
  auto key_view =
      std::string_view{reinterpret_cast<const char*>(key.data()), key.size()};
  if (!key_view.starts_with(kEventPrefix)) {
    return std::nullopt;
  }
  auto encoded = quill::schema::bytes_view_t{
      key.data() + kEventPrefix.size(), key.size() - kEventPrefix.size()};
  return key_encoder_t{}.try_decode<uint64_t>(encoded);
}

}  // namespace quill::schema::key
