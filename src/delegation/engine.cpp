#include <spdlog/spdlog.h>
#include <quill/delegation/engine.hpp>
#include <quill/schema/key/engine_keys.hpp>
#include <string>
#include <utility>

using namespace quill::schema;

namespace quill::delegation {

engine::engine(quill::schema::encoding::encoder<
                   quill::schema::encoding::scale_encoder_tag>& encoder,
               quill::storage::storage<quill::storage::rocksdb_storage_tag>&
                   storage,
               quill::signing::signing_domain_t domain,
               quill::execution::signer_recovery_t recover_signer)
    : encoder_{encoder},
      storage_{storage},
      domain_{std::move(domain)},
      recover_signer_{std::move(recover_signer)} {}

bool engine::is_authorized(const address_t& principal,
                           const address_t& relayer,
                           const scope_mask_t& capability,
                           const context_id_t& context,
                           const timestamp_seconds_t now) const {
  if (is_zero(context)) {
    return false;
  }
  auto grant = grant_of(principal, relayer, context);
  if (!grant || grant->expiry == 0 || now >= grant->expiry) {
    return false;
  }
  if (is_all_scopes(grant->scope_mask)) {
    return true;
  }
  return (grant->scope_mask & capability) != 0;
}

bool engine::is_authorized(const address_t& principal,
                           const address_t& relayer,
                           const capability_t capability,
                           const context_id_t& context,
                           const timestamp_seconds_t now) const {
  return is_authorized(principal, relayer, scope_of(capability), context, now);
}

bool engine::can_act_for(const quill::execution::call_context& context,
                         const address_t& principal,
                         const capability_t capability,
                         const context_id_t& scope) const {
  if (context.sender == principal) {
    return true;
  }
  return is_authorized(principal, context.sender, capability, scope,
                       context.now);
}

uint64_t engine::nonce_of(const address_t& principal) const {
  auto storage_key = key::make_delegation_nonce_key(principal);
  return storage_.get<uint64_t>(encoder_, storage_key).value_or(0);
}

std::optional<grant_record_t> engine::grant_of(
    const address_t& principal,
    const address_t& relayer,
    const context_id_t& context) const {
  auto storage_key = key::make_grant_key(principal, relayer, context);
  return storage_.get<grant_record_t>(encoder_, storage_key);
}

const quill::signing::signing_domain_t& engine::domain() const {
  return domain_;
}

operation_result_t engine::register_grant(
    const quill::execution::call_context& context,
    const register_grant_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return register_grant(context, request, batch);
      });
}

operation_result_t engine::revoke(
    const quill::execution::call_context& context,
    const revoke_grant_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return revoke(context, request, batch);
      });
}

operation_result_t engine::revoke_with_sig(
    const quill::execution::call_context& context,
    const revoke_grant_with_sig_t& request) {
  return quill::storage::commit_staged(
      storage_, [&](quill::storage::write_batch& batch) {
        return revoke_with_sig(context, request, batch);
      });
}

operation_result_t engine::register_grant(
    const quill::execution::call_context& context,
    const register_grant_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.principal)) {
    return reject(error_code::zero_principal, "register_grant");
  }
  if (is_zero(request.relayer)) {
    return reject(error_code::zero_relayer, "register_grant");
  }
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "register_grant");
  }
  if (context.now > request.deadline) {
    return reject(error_code::signature_expired, "register_grant");
  }
  if (request.expiry <= context.now) {
    return reject(error_code::bad_expiry, "register_grant");
  }

  auto nonce = nonce_of(request.principal);
  auto digest = quill::signing::make_digest(
      domain_, delegate_authorization_t{.principal = request.principal,
                                        .relayer = request.relayer,
                                        .context = request.context,
                                        .scope_mask = request.scope_mask,
                                        .nonce = nonce,
                                        .expiry = request.expiry,
                                        .deadline = request.deadline});
  if (!quill::execution::signed_by(recover_signer_, digest,
                                   request.signature, request.principal)) {
    return reject(error_code::bad_signer, "register_grant");
  }

  batch.put(encoder_, key::make_delegation_nonce_key(request.principal),
            nonce + 1);
  batch.put(encoder_,
            key::make_grant_key(request.principal, request.relayer,
                                request.context),
            grant_record_t{.principal = request.principal,
                           .relayer = request.relayer,
                           .context = request.context,
                           .scope_mask = request.scope_mask,
                           .expiry = request.expiry});

  spdlog::info("Delegated {} -> {} in context {} until {}",
               to_hex(request.principal), to_hex(request.relayer),
               to_hex(request.context), request.expiry);
  return make_success(
      kCodespace,
      {make_event("Delegated",
                  {make_attribute("principal", to_hex(request.principal), true),
                   make_attribute("relayer", to_hex(request.relayer), true),
                   make_attribute("context", to_hex(request.context), true),
                   make_attribute("scopes", to_hex(to_word(request.scope_mask))),
                   make_attribute("expiry", std::to_string(request.expiry))})});
}

operation_result_t engine::revoke(
    const quill::execution::call_context& context,
    const revoke_grant_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.relayer)) {
    return reject(error_code::zero_relayer, "revoke");
  }
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "revoke");
  }

  stage_revocation(batch, context.sender, request.relayer, request.context);

  spdlog::info("Revoked {} -> {} in context {}", to_hex(context.sender),
               to_hex(request.relayer), to_hex(request.context));
  return make_success(
      kCodespace,
      {make_event("Revoked",
                  {make_attribute("principal", to_hex(context.sender), true),
                   make_attribute("relayer", to_hex(request.relayer), true),
                   make_attribute("context", to_hex(request.context), true)})});
}

operation_result_t engine::revoke_with_sig(
    const quill::execution::call_context& context,
    const revoke_grant_with_sig_t& request,
    quill::storage::write_batch& batch) {
  if (is_zero(request.principal)) {
    return reject(error_code::zero_principal, "revoke_with_sig");
  }
  if (is_zero(request.relayer)) {
    return reject(error_code::zero_relayer, "revoke_with_sig");
  }
  if (is_zero(request.context)) {
    return reject(error_code::zero_context, "revoke_with_sig");
  }
  if (context.now > request.deadline) {
    return reject(error_code::signature_expired, "revoke_with_sig");
  }

  auto nonce = nonce_of(request.principal);
  auto digest = quill::signing::make_digest(
      domain_, revoke_authorization_t{.principal = request.principal,
                                      .relayer = request.relayer,
                                      .context = request.context,
                                      .nonce = nonce,
                                      .deadline = request.deadline});
  if (!quill::execution::signed_by(recover_signer_, digest,
                                   request.signature, request.principal)) {
    return reject(error_code::bad_signer, "revoke_with_sig");
  }

  batch.put(encoder_, key::make_delegation_nonce_key(request.principal),
            nonce + 1);
  stage_revocation(batch, request.principal, request.relayer, request.context);

  spdlog::info("Revoked {} -> {} in context {} by signature",
               to_hex(request.principal), to_hex(request.relayer),
               to_hex(request.context));
  return make_success(
      kCodespace,
      {make_event(
          "Revoked",
          {make_attribute("principal", to_hex(request.principal), true),
           make_attribute("relayer", to_hex(request.relayer), true),
           make_attribute("context", to_hex(request.context), true)})});
}

operation_result_t engine::reject(const error_code code,
                                  const std::string_view operation) const {
  spdlog::debug("{} rejected: {}", operation, to_string(code));
  return make_failure(kCodespace, code);
}

void engine::stage_revocation(quill::storage::write_batch& batch,
                              const address_t& principal,
                              const address_t& relayer,
                              const context_id_t& context) {
  batch.put(encoder_, key::make_grant_key(principal, relayer, context),
            grant_record_t{.principal = principal,
                           .relayer = relayer,
                           .context = context,
                           .scope_mask = scope_mask_t{0},
                           .expiry = 0});
}

}  // namespace quill::delegation
