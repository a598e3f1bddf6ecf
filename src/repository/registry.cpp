#include <spdlog/spdlog.h>
#include <quill/repository/registry.hpp>
#include <quill/schema/key/engine_keys.hpp>
#include <string>

using namespace quill::schema;

namespace quill::repository {

registry::registry(
    quill::schema::encoding::encoder<
        quill::schema::encoding::scale_encoder_tag>& encoder,
    quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
    const quill::delegation::engine& delegation,
    const quill::workspace::registry& workspace)
    : encoder_{encoder},
      storage_{storage},
      delegation_{delegation},
      workspace_{workspace} {}

std::optional<repository_state_t> registry::repository_of(
    const repository_id_t& repository_id) const {
  auto storage_key = key::make_repository_key(repository_id);
  return storage_.get<repository_state_t>(encoder_, storage_key);
}

bool registry::is_claimed(const repository_id_t& repository_id) const {
  return storage_.exists(key::make_repository_key(repository_id));
}

address_t registry::owner_of(const repository_id_t& repository_id) const {
  auto state = repository_of(repository_id);
  if (!state) {
    return address_t{};
  }
  return state->owner;
}

std::vector<address_t> registry::owners_of(
    const std::vector<repository_id_t>& repository_ids) const {
  auto owners = std::vector<address_t>{};
  owners.reserve(repository_ids.size());
  for (const auto& repository_id : repository_ids) {
    owners.push_back(owner_of(repository_id));
  }
  return owners;
}

std::vector<repository_id_t> registry::repositories_of(
    const address_t& owner) const {
  auto prefix = key::make_owner_repository_prefix_key(owner);
  auto repositories = std::vector<repository_id_t>{};
  for (const auto& [stored_key, value] : storage_.list_by_prefix(prefix)) {
    repositories.push_back(encoder_.decode<repository_id_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return repositories;
}

operation_result_t registry::claim(
    const quill::execution::call_context& context,
    const claim_repository_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return claim(context, request, batch);
      });
}

operation_result_t registry::transfer(
    const quill::execution::call_context& context,
    const transfer_repository_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return transfer(context, request, batch);
      });
}

operation_result_t registry::claim(
    const quill::execution::call_context& context,
    const claim_repository_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.repository_id)) {
    return reject(error_code::zero_identifier, "claim");
  }
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "claim");
  }
  if (is_zero(request.owner)) {
    return reject(error_code::zero_identity, "claim");
  }
  if (is_claimed(request.repository_id)) {
    return reject(error_code::repository_claimed, "claim");
  }
  if (!delegation_.can_act_for(context, request.owner, capability_t::claim,
                               request.context)) {
    return reject(error_code::not_authorized, "claim");
  }
  if (!workspace_.is_member(request.context, request.owner)) {
    return reject(error_code::owner_not_member, "claim");
  }

  batch.put(encoder_, key::make_repository_key(request.repository_id),
            repository_state_t{.repository_id = request.repository_id,
                               .owner = request.owner,
                               .context = request.context,
                               .metadata = request.metadata,
                               .claimed_at = context.now});
  batch.put(encoder_,
            key::make_owner_repository_key(request.owner,
                                           request.repository_id),
            request.repository_id);

  spdlog::info("Repository {} claimed by {} in context {}",
               to_hex(request.repository_id), to_hex(request.owner),
               to_hex(request.context));
  return make_success(
      kCodespace,
      {make_event("RepoClaimed",
                  {make_attribute("repository", to_hex(request.repository_id),
                                  true),
                   make_attribute("owner", to_hex(request.owner), true),
                   make_attribute("context", to_hex(request.context), true),
                   make_attribute("metadata", request.metadata)})});
}

operation_result_t registry::transfer(
    const quill::execution::call_context& context,
    const transfer_repository_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.repository_id)) {
    return reject(error_code::zero_identifier, "transfer");
  }
  if (is_zero(request.new_owner)) {
    return reject(error_code::zero_identity, "transfer");
  }
  if (is_zero(request.new_context)) {
    return reject(error_code::zero_context, "transfer");
  }
  auto state = repository_of(request.repository_id);
  if (!state) {
    return reject(error_code::repository_missing, "transfer");
  }
  if (!delegation_.can_act_for(context, state->owner, capability_t::claim,
                               state->context)) {
    return reject(error_code::not_authorized, "transfer");
  }
  if (state->owner == request.new_owner &&
      state->context == request.new_context) {
    return reject(error_code::no_change, "transfer");
  }
  if (!workspace_.is_member(request.new_context, request.new_owner)) {
    return reject(error_code::owner_not_member, "transfer");
  }

  auto previous_owner = state->owner;
  auto previous_context = state->context;
  state->owner = request.new_owner;
  state->context = request.new_context;

  batch.erase(
      key::make_owner_repository_key(previous_owner, request.repository_id));
  batch.put(encoder_, key::make_repository_key(request.repository_id),
            state.value());
  batch.put(encoder_,
            key::make_owner_repository_key(request.new_owner,
                                           request.repository_id),
            request.repository_id);

  spdlog::info("Repository {} transferred {} -> {}",
               to_hex(request.repository_id), to_hex(previous_owner),
               to_hex(request.new_owner));
  return make_success(
      kCodespace,
      {make_event(
          "RepoTransferred",
          {make_attribute("repository", to_hex(request.repository_id), true),
           make_attribute("from_owner", to_hex(previous_owner), true),
           make_attribute("to_owner", to_hex(request.new_owner), true),
           make_attribute("from_context", to_hex(previous_context)),
           make_attribute("to_context", to_hex(request.new_context))})});
}

operation_result_t registry::reject(const error_code code,
                                    const std::string_view operation) const {
  spdlog::debug("repository {} rejected: {}", operation, to_string(code));
  return make_failure(kCodespace, code);
}

}  // namespace quill::repository
