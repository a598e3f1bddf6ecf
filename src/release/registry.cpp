#include <spdlog/spdlog.h>
#include <quill/release/registry.hpp>
#include <quill/schema/key/engine_keys.hpp>
#include <string>

using namespace quill::schema;

namespace quill::release {

registry::registry(
    quill::schema::encoding::encoder<
        quill::schema::encoding::scale_encoder_tag>& encoder,
    quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
    const quill::delegation::engine& delegation,
    const quill::workspace::registry& workspace,
    const quill::snapshot::registry& snapshots)
    : encoder_{encoder},
      storage_{storage},
      delegation_{delegation},
      workspace_{workspace},
      snapshots_{snapshots} {}

std::optional<release_state_t> registry::release_by_id(
    const release_id_t& release_id) const {
  auto storage_key = key::make_release_key(release_id);
  return storage_.get<release_state_t>(encoder_, storage_key);
}

std::optional<release_state_t> registry::release_by_index(
    const project_id_t& project_id,
    const uint64_t index) const {
  if (index >= releases_count(project_id)) {
    return std::nullopt;
  }
  auto storage_key = key::make_project_release_key(project_id, index);
  auto release_id = storage_.get<release_id_t>(encoder_, storage_key);
  if (!release_id) {
    return std::nullopt;
  }
  return release_by_id(release_id.value());
}

uint64_t registry::releases_count(const project_id_t& project_id) const {
  auto storage_key = key::make_project_release_count_key(project_id);
  return storage_.get<uint64_t>(encoder_, storage_key).value_or(0);
}

std::optional<governance_status_t> registry::governance_status_of(
    const release_id_t& release_id) const {
  auto release = release_by_id(release_id);
  if (!release) {
    return std::nullopt;
  }
  return release->status;
}

address_t registry::dao_executor_of(const context_id_t& context) const {
  auto storage_key = key::make_dao_executor_key(context);
  return storage_.get<address_t>(encoder_, storage_key).value_or(address_t{});
}

operation_result_t registry::anchor(
    const quill::execution::call_context& context,
    const anchor_release_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return anchor(context, request, batch);
      });
}

operation_result_t registry::set_governance_status(
    const quill::execution::call_context& context,
    const set_governance_status_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return set_governance_status(context, request, batch);
      });
}

operation_result_t registry::revoke(
    const quill::execution::call_context& context,
    const revoke_release_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return revoke(context, request, batch);
      });
}

operation_result_t registry::supersede(
    const quill::execution::call_context& context,
    const supersede_release_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return supersede(context, request, batch);
      });
}

operation_result_t registry::set_dao_executor(
    const quill::execution::call_context& context,
    const set_dao_executor_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return set_dao_executor(context, request, batch);
      });
}

operation_result_t registry::anchor(
    const quill::execution::call_context& context,
    const anchor_release_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.project_id) || is_zero(request.release_id)) {
    return fail(error_code::zero_identifier, "anchor");
  }
  if (is_zero(request.context)) {
    return fail(error_code::zero_context, "anchor");
  }
  if (is_zero(request.author) || is_zero(request.governance_authority)) {
    return fail(error_code::zero_identity, "anchor");
  }
  if (request.manifest_ref.empty()) {
    return fail(error_code::empty_manifest, "anchor");
  }
  if (request.snapshots.empty()) {
    return fail(error_code::empty_snapshot_refs, "anchor");
  }
  if (!delegation_.can_act_for(context, request.author, capability_t::release,
                               request.context)) {
    return fail(error_code::not_authorized, "anchor");
  }
  if (storage_.exists(key::make_release_key(request.release_id))) {
    return fail(error_code::release_exists, "anchor");
  }
  if (!workspace_.is_member(request.context, request.author)) {
    return fail(error_code::author_not_member, "anchor");
  }
  if (!workspace_.is_member(request.context, request.governance_authority)) {
    return fail(error_code::governance_not_member, "anchor");
  }
  for (const auto& snapshot : request.snapshots) {
    if (!snapshots_.exists(snapshot.repository_id, snapshot.merkle_root)) {
      return fail(error_code::snapshot_missing, "anchor");
    }
  }

  auto release = release_state_t{
      .release_id = request.release_id,
      .project_id = request.project_id,
      .context = request.context,
      .manifest_ref = request.manifest_ref,
      .name = request.name,
      .created_at = context.now,
      .author = request.author,
      .governance_authority = request.governance_authority,
      .snapshots = request.snapshots,
      .status = governance_status_t::pending};

  auto index = releases_count(request.project_id);
  stage_release(batch, release);
  batch.put(encoder_, key::make_project_release_key(request.project_id, index),
            request.release_id);
  batch.put(encoder_, key::make_project_release_count_key(request.project_id),
            index + 1);

  spdlog::info("Release {} anchored for project {} with {} snapshot(s)",
               to_hex(request.release_id), to_hex(request.project_id),
               request.snapshots.size());
  return make_success(
      kCodespace,
      {make_event(
          "ReleaseAnchored",
          {make_attribute("project", to_hex(request.project_id), true),
           make_attribute("release", to_hex(request.release_id), true),
           make_attribute("context", to_hex(request.context), true),
           make_attribute("author", to_hex(request.author), true),
           make_attribute("governance",
                          to_hex(request.governance_authority)),
           make_attribute("manifest", request.manifest_ref),
           make_attribute("name", request.name),
           make_attribute("created_at", std::to_string(context.now))})});
}

operation_result_t registry::set_governance_status(
    const quill::execution::call_context& context,
    const set_governance_status_t& request,
    quill::storage::write_batch& batch) {
  if (request.status != governance_status_t::accepted &&
      request.status != governance_status_t::rejected) {
    return fail(error_code::invalid_status, "set_governance_status");
  }
  if (is_zero(request.release_id)) {
    return fail(error_code::zero_identifier, "set_governance_status");
  }
  auto release = release_by_id(request.release_id);
  if (!release) {
    return fail(error_code::release_missing, "set_governance_status");
  }
  if (!may_govern(context, release.value())) {
    return fail(error_code::not_governance, "set_governance_status");
  }
  if (release->revoked) {
    return fail(error_code::release_revoked, "set_governance_status");
  }
  if (release->status != governance_status_t::pending) {
    return fail(error_code::release_not_pending, "set_governance_status");
  }

  release->status = request.status;
  release->status_timestamp = context.now;
  release->status_author = context.sender;

  stage_release(batch, release.value());

  spdlog::info("Release {} marked {} by {}", to_hex(request.release_id),
               to_string(request.status), to_hex(context.sender));
  return make_success(
      kCodespace,
      {make_event(
          "GovernanceStatusChanged",
          {make_attribute("release", to_hex(request.release_id), true),
           make_attribute("status", std::string{to_string(request.status)}),
           make_attribute("actor", to_hex(context.sender), true),
           make_attribute("timestamp", std::to_string(context.now))})});
}

operation_result_t registry::accept(
    const quill::execution::call_context& context,
    const release_id_t& release_id) {
  return set_governance_status(
      context, set_governance_status_t{.release_id = release_id,
                                       .status = governance_status_t::accepted});
}

operation_result_t registry::reject(
    const quill::execution::call_context& context,
    const release_id_t& release_id) {
  return set_governance_status(
      context, set_governance_status_t{.release_id = release_id,
                                       .status = governance_status_t::rejected});
}

operation_result_t registry::revoke(
    const quill::execution::call_context& context,
    const revoke_release_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.release_id)) {
    return fail(error_code::zero_identifier, "revoke");
  }
  if (is_zero(request.author)) {
    return fail(error_code::zero_identity, "revoke");
  }
  auto release = release_by_id(request.release_id);
  if (!release) {
    return fail(error_code::release_missing, "revoke");
  }
  if (release->author != request.author) {
    return fail(error_code::author_mismatch, "revoke");
  }
  if (!delegation_.can_act_for(context, request.author, capability_t::release,
                               release->context)) {
    return fail(error_code::not_authorized, "revoke");
  }

  release->revoked = true;
  stage_release(batch, release.value());

  spdlog::info("Release {} revoked by {}", to_hex(request.release_id),
               to_hex(context.sender));
  return make_success(
      kCodespace,
      {make_event(
          "ReleaseRevoked",
          {make_attribute("project", to_hex(release->project_id), true),
           make_attribute("release", to_hex(request.release_id), true),
           make_attribute("author", to_hex(request.author), true),
           make_attribute("timestamp", std::to_string(context.now))})});
}

operation_result_t registry::supersede(
    const quill::execution::call_context& context,
    const supersede_release_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.old_release_id) || is_zero(request.new_release_id)) {
    return fail(error_code::zero_identifier, "supersede");
  }
  if (request.old_release_id == request.new_release_id) {
    return fail(error_code::self_supersession, "supersede");
  }
  if (is_zero(request.author)) {
    return fail(error_code::zero_identity, "supersede");
  }
  auto previous = release_by_id(request.old_release_id);
  auto replacement = release_by_id(request.new_release_id);
  if (!previous || !replacement) {
    return fail(error_code::release_missing, "supersede");
  }
  if (previous->project_id != replacement->project_id) {
    return fail(error_code::project_mismatch, "supersede");
  }
  if (previous->author != request.author) {
    return fail(error_code::author_mismatch, "supersede");
  }
  if (!delegation_.can_act_for(context, request.author, capability_t::release,
                               previous->context)) {
    return fail(error_code::not_authorized, "supersede");
  }
  if (!previous->revoked) {
    return fail(error_code::release_not_revoked, "supersede");
  }
  if (previous->superseded_by.has_value()) {
    return fail(error_code::release_already_superseded, "supersede");
  }
  if (replacement->revoked) {
    return fail(error_code::replacement_revoked, "supersede");
  }

  previous->superseded_by = request.new_release_id;
  stage_release(batch, previous.value());

  spdlog::info("Release {} superseded by {}", to_hex(request.old_release_id),
               to_hex(request.new_release_id));
  return make_success(
      kCodespace,
      {make_event(
          "ReleaseSuperseded",
          {make_attribute("project", to_hex(previous->project_id), true),
           make_attribute("old_release", to_hex(request.old_release_id), true),
           make_attribute("new_release", to_hex(request.new_release_id), true),
           make_attribute("author", to_hex(request.author)),
           make_attribute("timestamp", std::to_string(context.now))})});
}

operation_result_t registry::set_dao_executor(
    const quill::execution::call_context& context,
    const set_dao_executor_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.context)) {
    return fail(error_code::zero_context, "set_dao_executor");
  }
  if (is_zero(request.author)) {
    return fail(error_code::zero_identity, "set_dao_executor");
  }
  if (!delegation_.can_act_for(context, request.author, capability_t::release,
                               request.context)) {
    return fail(error_code::not_authorized, "set_dao_executor");
  }
  if (!workspace_.is_member(request.context, request.author)) {
    return fail(error_code::author_not_member, "set_dao_executor");
  }

  auto storage_key = key::make_dao_executor_key(request.context);
  if (is_zero(request.executor)) {
    batch.erase(storage_key);
  } else {
    batch.put(encoder_, storage_key, request.executor);
  }

  spdlog::info("DAO executor of context {} set to {}", to_hex(request.context),
               to_hex(request.executor));
  return make_success(
      kCodespace,
      {make_event("DaoExecutorSet",
                  {make_attribute("context", to_hex(request.context), true),
                   make_attribute("executor", to_hex(request.executor),
                                  true)})});
}

bool registry::may_govern(const quill::execution::call_context& context,
                          const release_state_t& release) const {
  if (context.sender == release.governance_authority) {
    return true;
  }
  auto executor = dao_executor_of(release.context);
  if (!is_zero(executor) && context.sender == executor) {
    return true;
  }
  return delegation_.is_authorized(release.governance_authority,
                                   context.sender, capability_t::release,
                                   release.context, context.now);
}

void registry::stage_release(quill::storage::write_batch& batch,
                             const release_state_t& release) {
  batch.put(encoder_, key::make_release_key(release.release_id), release);
}

operation_result_t registry::fail(const error_code code,
                                  const std::string_view operation) const {
  spdlog::debug("release {} rejected: {}", operation, to_string(code));
  return make_failure(kCodespace, code);
}

}  // namespace quill::release
