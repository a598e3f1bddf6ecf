#include <spdlog/spdlog.h>
#include <quill/schema/key/engine_keys.hpp>
#include <quill/workspace/registry.hpp>
#include <utility>

using namespace quill::schema;

namespace quill::workspace {

namespace {

event_t make_authority_set_event(const context_id_t& context,
                                 const address_t& authority) {
  return make_event("AuthoritySet",
                    {make_attribute("context", to_hex(context), true),
                     make_attribute("authority", to_hex(authority), true)});
}

event_t make_member_set_event(const context_id_t& context,
                              const address_t& member,
                              const bool is_member) {
  return make_event("MemberSet",
                    {make_attribute("context", to_hex(context), true),
                     make_attribute("member", to_hex(member), true),
                     make_attribute("is_member", is_member ? "true" : "false")});
}

}  // namespace

registry::registry(
    quill::schema::encoding::encoder<
        quill::schema::encoding::scale_encoder_tag>& encoder,
    quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
    quill::signing::signing_domain_t domain,
    quill::execution::signer_recovery_t recover_signer)
    : encoder_{encoder},
      storage_{storage},
      domain_{std::move(domain)},
      recover_signer_{std::move(recover_signer)} {}

bool registry::is_member(const context_id_t& context,
                         const address_t& identity) const {
  auto storage_key = key::make_workspace_member_key(context, identity);
  return storage_.get<bool>(encoder_, storage_key).value_or(false);
}

address_t registry::authority_of(const context_id_t& context) const {
  auto storage_key = key::make_workspace_key(context);
  auto state = storage_.get<workspace_state_t>(encoder_, storage_key);
  if (!state) {
    return address_t{};
  }
  return state->authority;
}

uint64_t registry::nonce_of(const address_t& authority) const {
  auto storage_key = key::make_workspace_nonce_key(authority);
  return storage_.get<uint64_t>(encoder_, storage_key).value_or(0);
}

const quill::signing::signing_domain_t& registry::domain() const {
  return domain_;
}

operation_result_t registry::init_authority(
    const quill::execution::call_context& context,
    const init_authority_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return init_authority(context, request, batch);
      });
}

operation_result_t registry::set_authority_with_sig(
    const quill::execution::call_context& context,
    const set_authority_with_sig_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return set_authority_with_sig(context, request, batch);
      });
}

operation_result_t registry::set_member_with_sig(
    const quill::execution::call_context& context,
    const set_member_with_sig_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return set_member_with_sig(context, request, batch);
      });
}

operation_result_t registry::leave(
    const quill::execution::call_context& context,
    const leave_workspace_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return leave(context, request, batch);
      });
}

operation_result_t registry::init_authority(
    const quill::execution::call_context& context,
    const init_authority_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "init_authority");
  }
  if (is_zero(request.authority)) {
    return reject(error_code::zero_identity, "init_authority");
  }
  if (!is_zero(authority_of(request.context))) {
    return reject(error_code::authority_exists, "init_authority");
  }

  batch.put(encoder_, key::make_workspace_key(request.context),
            workspace_state_t{.context = request.context,
                              .authority = request.authority});
  batch.put(encoder_,
            key::make_workspace_member_key(request.context, request.authority),
            true);

  spdlog::info("Workspace {} initialized by {} with authority {}",
               to_hex(request.context), to_hex(context.sender),
               to_hex(request.authority));
  return make_success(
      kCodespace,
      {make_authority_set_event(request.context, request.authority),
       make_member_set_event(request.context, request.authority, true)});
}

operation_result_t registry::set_authority_with_sig(
    const quill::execution::call_context& context,
    const set_authority_with_sig_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "set_authority_with_sig");
  }
  if (is_zero(request.new_authority)) {
    return reject(error_code::zero_identity, "set_authority_with_sig");
  }
  if (context.now > request.deadline) {
    return reject(error_code::signature_expired, "set_authority_with_sig");
  }
  auto current = authority_of(request.context);
  if (is_zero(current)) {
    return reject(error_code::authority_missing, "set_authority_with_sig");
  }

  auto nonce = nonce_of(current);
  auto digest = quill::signing::make_digest(
      domain_, set_authority_authorization_t{.context = request.context,
                                             .authority = request.new_authority,
                                             .nonce = nonce,
                                             .deadline = request.deadline});
  if (!quill::execution::signed_by(recover_signer_, digest,
                                   request.signature, current)) {
    return reject(error_code::bad_signer, "set_authority_with_sig");
  }

  batch.put(encoder_, key::make_workspace_nonce_key(current), nonce + 1);
  batch.put(encoder_, key::make_workspace_key(request.context),
            workspace_state_t{.context = request.context,
                              .authority = request.new_authority});
  batch.put(encoder_,
            key::make_workspace_member_key(request.context,
                                           request.new_authority),
            true);

  spdlog::info("Workspace {} authority rotated {} -> {}",
               to_hex(request.context), to_hex(current),
               to_hex(request.new_authority));
  return make_success(
      kCodespace,
      {make_authority_set_event(request.context, request.new_authority),
       make_member_set_event(request.context, request.new_authority, true)});
}

operation_result_t registry::set_member_with_sig(
    const quill::execution::call_context& context,
    const set_member_with_sig_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "set_member_with_sig");
  }
  if (is_zero(request.member)) {
    return reject(error_code::zero_identity, "set_member_with_sig");
  }
  if (context.now > request.deadline) {
    return reject(error_code::signature_expired, "set_member_with_sig");
  }
  auto authority = authority_of(request.context);
  if (is_zero(authority)) {
    return reject(error_code::authority_missing, "set_member_with_sig");
  }
  if (!request.is_member && request.member == authority) {
    return reject(error_code::cannot_remove_authority, "set_member_with_sig");
  }

  auto nonce = nonce_of(authority);
  auto digest = quill::signing::make_digest(
      domain_, set_member_authorization_t{.context = request.context,
                                          .member = request.member,
                                          .is_member = request.is_member,
                                          .nonce = nonce,
                                          .deadline = request.deadline});
  if (!quill::execution::signed_by(recover_signer_, digest,
                                   request.signature, authority)) {
    return reject(error_code::bad_signer, "set_member_with_sig");
  }

  batch.put(encoder_, key::make_workspace_nonce_key(authority), nonce + 1);
  batch.put(encoder_,
            key::make_workspace_member_key(request.context, request.member),
            request.is_member);

  spdlog::info("Workspace {} member {} set to {}", to_hex(request.context),
               to_hex(request.member), request.is_member);
  return make_success(kCodespace,
                      {make_member_set_event(request.context, request.member,
                                             request.is_member)});
}

operation_result_t registry::leave(
    const quill::execution::call_context& context,
    const leave_workspace_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "leave");
  }
  if (authority_of(request.context) == context.sender) {
    return reject(error_code::authority_cannot_leave, "leave");
  }

  batch.put(encoder_,
            key::make_workspace_member_key(request.context, context.sender),
            false);

  spdlog::info("{} left workspace {}", to_hex(context.sender),
               to_hex(request.context));
  return make_success(
      kCodespace,
      {make_member_set_event(request.context, context.sender, false)});
}

operation_result_t registry::reject(const error_code code,
                                    const std::string_view operation) const {
  spdlog::debug("workspace {} rejected: {}", operation, to_string(code));
  return make_failure(kCodespace, code);
}

}  // namespace quill::workspace
