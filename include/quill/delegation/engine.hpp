#pragma once

#include <quill/execution/call_context.hpp>
#include <quill/execution/signer_recovery.hpp>
#include <quill/schema/capability.hpp>
#include <quill/schema/delegation_requests.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/grant_record.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/signing/digest.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quill::delegation {

inline constexpr std::string_view kCodespace{"quill.delegation"};

/// Grant table and per-principal nonce of the delegation layer.
///
/// A principal signs a grant off-line; anyone may submit it. Consumers ask
/// `is_authorized` whenever the acting identity differs from the principal
/// they act for. Registration and revocation by signature share one nonce per
/// principal, so any signed request invalidates every other outstanding
/// signature prepared with the same nonce.
class engine final {
 public:
  engine(quill::schema::encoding::encoder<
             quill::schema::encoding::scale_encoder_tag>& encoder,
         quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
         quill::signing::signing_domain_t domain,
         quill::execution::signer_recovery_t recover_signer);

  /// True iff a live grant (principal, relayer, context) covers `capability`.
  ///
  /// A zero context, a missing or zeroed grant, and `now >= expiry` all answer
  /// false. Only the all-capabilities sentinel acts as a wildcard.
  bool is_authorized(const quill::schema::address_t& principal,
                     const quill::schema::address_t& relayer,
                     const quill::schema::scope_mask_t& capability,
                     const quill::schema::context_id_t& context,
                     quill::schema::timestamp_seconds_t now) const;

  bool is_authorized(const quill::schema::address_t& principal,
                     const quill::schema::address_t& relayer,
                     quill::schema::capability_t capability,
                     const quill::schema::context_id_t& context,
                     quill::schema::timestamp_seconds_t now) const;

  /// The sender is `principal` itself or holds `capability` from it.
  bool can_act_for(const quill::execution::call_context& context,
                   const quill::schema::address_t& principal,
                   quill::schema::capability_t capability,
                   const quill::schema::context_id_t& scope) const;

  uint64_t nonce_of(const quill::schema::address_t& principal) const;

  std::optional<quill::schema::grant_record_t> grant_of(
      const quill::schema::address_t& principal,
      const quill::schema::address_t& relayer,
      const quill::schema::context_id_t& context) const;

  const quill::signing::signing_domain_t& domain() const;

  quill::schema::operation_result_t register_grant(
      const quill::execution::call_context& context,
      const quill::schema::register_grant_t& request);

  /// Direct revocation by the principal (the sender). Idempotent.
  quill::schema::operation_result_t revoke(
      const quill::execution::call_context& context,
      const quill::schema::revoke_grant_t& request);

  quill::schema::operation_result_t revoke_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::revoke_grant_with_sig_t& request);

  /// Staging variants of the operations above. Each validates and puts its
  /// writes into `batch` without committing; a rejected call leaves `batch`
  /// as it was.
  quill::schema::operation_result_t register_grant(
      const quill::execution::call_context& context,
      const quill::schema::register_grant_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t revoke(
      const quill::execution::call_context& context,
      const quill::schema::revoke_grant_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t revoke_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::revoke_grant_with_sig_t& request,
      quill::storage::write_batch& batch);

 private:
  quill::schema::operation_result_t reject(quill::schema::error_code code,
                                           std::string_view operation) const;

  void stage_revocation(quill::storage::write_batch& batch,
                        const quill::schema::address_t& principal,
                        const quill::schema::address_t& relayer,
                        const quill::schema::context_id_t& context);

  quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>&
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage_;
  quill::signing::signing_domain_t domain_;
  quill::execution::signer_recovery_t recover_signer_;
};

}  // namespace quill::delegation
