#include <spdlog/spdlog.h>
#include <quill/schema/key/engine_keys.hpp>
#include <quill/snapshot/registry.hpp>
#include <string>

using namespace quill::schema;

namespace quill::snapshot {

registry::registry(
    quill::schema::encoding::encoder<
        quill::schema::encoding::scale_encoder_tag>& encoder,
    quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
    const quill::delegation::engine& delegation,
    const quill::repository::registry& repositories)
    : encoder_{encoder},
      storage_{storage},
      delegation_{delegation},
      repositories_{repositories} {}

bool registry::exists(const repository_id_t& repository_id,
                      const hash32_t& merkle_root) const {
  auto storage_key = key::make_snapshot_root_key(repository_id, merkle_root);
  return storage_.get<uint64_t>(encoder_, storage_key).value_or(0) != 0;
}

uint64_t registry::snapshots_count(const repository_id_t& repository_id) const {
  auto storage_key = key::make_snapshot_count_key(repository_id);
  return storage_.get<uint64_t>(encoder_, storage_key).value_or(0);
}

std::optional<snapshot_state_t> registry::snapshot_at(
    const repository_id_t& repository_id,
    const uint64_t index) const {
  if (index >= snapshots_count(repository_id)) {
    return std::nullopt;
  }
  auto storage_key = key::make_snapshot_key(repository_id, index);
  return storage_.get<snapshot_state_t>(encoder_, storage_key);
}

std::optional<snapshot_state_t> registry::snapshot_by_root(
    const repository_id_t& repository_id,
    const hash32_t& merkle_root) const {
  auto storage_key = key::make_snapshot_root_key(repository_id, merkle_root);
  auto slot = storage_.get<uint64_t>(encoder_, storage_key).value_or(0);
  if (slot == 0) {
    return std::nullopt;
  }
  return snapshot_at(repository_id, slot - 1);
}

operation_result_t registry::create(
    const quill::execution::call_context& context,
    const create_snapshot_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return create(context, request, batch);
      });
}

operation_result_t registry::create(
    const quill::execution::call_context& context,
    const create_snapshot_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.repository_id) || is_zero(request.merkle_root)) {
    return reject(error_code::zero_identifier, "create");
  }
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "create");
  }
  if (is_zero(request.author)) {
    return reject(error_code::zero_identity, "create");
  }
  auto repository = repositories_.repository_of(request.repository_id);
  if (!repository) {
    return reject(error_code::repository_missing, "create");
  }
  if (repository->context != request.context) {
    return reject(error_code::repository_wrong_context, "create");
  }
  if (repository->owner != request.author) {
    return reject(error_code::author_not_owner, "create");
  }
  if (!delegation_.can_act_for(context, request.author,
                               capability_t::snapshot, request.context)) {
    return reject(error_code::not_authorized, "create");
  }
  if (exists(request.repository_id, request.merkle_root)) {
    return reject(error_code::duplicate_root, "create");
  }

  auto index = snapshots_count(request.repository_id);
  auto state = snapshot_state_t{.repository_id = request.repository_id,
                                .index = index,
                                .context = request.context,
                                .author = request.author,
                                .commit_hash = request.commit_hash,
                                .merkle_root = request.merkle_root,
                                .manifest_ref = request.manifest_ref,
                                .created_at = context.now};

  batch.put(encoder_, key::make_snapshot_key(request.repository_id, index),
            state);
  batch.put(encoder_,
            key::make_snapshot_root_key(request.repository_id,
                                        request.merkle_root),
            index + 1);
  batch.put(encoder_, key::make_snapshot_count_key(request.repository_id),
            index + 1);

  spdlog::info("Snapshot {} of repository {} anchored at root {}", index,
               to_hex(request.repository_id), to_hex(request.merkle_root));
  return make_success(
      kCodespace,
      {make_event(
          "SnapshotCreated",
          {make_attribute("repository", to_hex(request.repository_id), true),
           make_attribute("index", std::to_string(index)),
           make_attribute("context", to_hex(request.context), true),
           make_attribute("author", to_hex(request.author), true),
           make_attribute("commit", to_hex(request.commit_hash)),
           make_attribute("merkle_root", to_hex(request.merkle_root), true),
           make_attribute("manifest", request.manifest_ref),
           make_attribute("created_at", std::to_string(context.now))})});
}

operation_result_t registry::reject(const error_code code,
                                    const std::string_view operation) const {
  spdlog::debug("snapshot {} rejected: {}", operation, to_string(code));
  return make_failure(kCodespace, code);
}

}  // namespace quill::snapshot
