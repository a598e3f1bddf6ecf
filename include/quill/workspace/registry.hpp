#pragma once

#include <quill/execution/call_context.hpp>
#include <quill/execution/signer_recovery.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/schema/workspace_requests.hpp>
#include <quill/schema/workspace_state.hpp>
#include <quill/signing/digest.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <string_view>

namespace quill::workspace {

inline constexpr std::string_view kCodespace{"quill.workspace"};

/// Membership of workspace contexts.
///
/// Each context has one authority, set once by anyone through
/// `init_authority` and rotated afterwards only by the authority's signature.
/// The authority is always a member. Signed requests consume a nonce kept per
/// signing authority, independent of the delegation nonce.
class registry final {
 public:
  registry(
      quill::schema::encoding::encoder<
          quill::schema::encoding::scale_encoder_tag>& encoder,
      quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
      quill::signing::signing_domain_t domain,
      quill::execution::signer_recovery_t recover_signer);

  bool is_member(const quill::schema::context_id_t& context,
                 const quill::schema::address_t& identity) const;

  /// Zero address while the context is uninitialized.
  quill::schema::address_t authority_of(
      const quill::schema::context_id_t& context) const;

  uint64_t nonce_of(const quill::schema::address_t& authority) const;

  const quill::signing::signing_domain_t& domain() const;

  quill::schema::operation_result_t init_authority(
      const quill::execution::call_context& context,
      const quill::schema::init_authority_t& request);

  quill::schema::operation_result_t set_authority_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::set_authority_with_sig_t& request);

  quill::schema::operation_result_t set_member_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::set_member_with_sig_t& request);

  /// The sender drops its own membership.
  quill::schema::operation_result_t leave(
      const quill::execution::call_context& context,
      const quill::schema::leave_workspace_t& request);

  /// Staging variants of the operations above. Each validates and puts its
  /// writes into `batch` without committing; a rejected call leaves `batch`
  /// as it was.
  quill::schema::operation_result_t init_authority(
      const quill::execution::call_context& context,
      const quill::schema::init_authority_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t set_authority_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::set_authority_with_sig_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t set_member_with_sig(
      const quill::execution::call_context& context,
      const quill::schema::set_member_with_sig_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t leave(
      const quill::execution::call_context& context,
      const quill::schema::leave_workspace_t& request,
      quill::storage::write_batch& batch);

 private:
  quill::schema::operation_result_t reject(quill::schema::error_code code,
                                           std::string_view operation) const;

  quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>&
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage_;
  quill::signing::signing_domain_t domain_;
  quill::execution::signer_recovery_t recover_signer_;
};

}  // namespace quill::workspace
