#pragma once

#include <quill/delegation/engine.hpp>
#include <quill/execution/call_context.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/governance_status.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/schema/release_requests.hpp>
#include <quill/schema/release_state.hpp>
#include <quill/snapshot/registry.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <quill/workspace/registry.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quill::release {

inline constexpr std::string_view kCodespace{"quill.release"};

/// Release records and their governance lifecycle.
///
/// A release starts PENDING and moves once to ACCEPTED or REJECTED. The
/// `revoked` flag is orthogonal to the status and blocks further governance
/// decisions. A revoked release may point once at a non-revoked successor of
/// the same project, so supersession links form acyclic chains.
class registry final {
 public:
  registry(
      quill::schema::encoding::encoder<
          quill::schema::encoding::scale_encoder_tag>& encoder,
      quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
      const quill::delegation::engine& delegation,
      const quill::workspace::registry& workspace,
      const quill::snapshot::registry& snapshots);

  std::optional<quill::schema::release_state_t> release_by_id(
      const quill::schema::release_id_t& release_id) const;

  std::optional<quill::schema::release_state_t> release_by_index(
      const quill::schema::project_id_t& project_id,
      uint64_t index) const;

  uint64_t releases_count(const quill::schema::project_id_t& project_id) const;

  std::optional<quill::schema::governance_status_t> governance_status_of(
      const quill::schema::release_id_t& release_id) const;

  /// Zero address when no executor is configured for the context.
  quill::schema::address_t dao_executor_of(
      const quill::schema::context_id_t& context) const;

  quill::schema::operation_result_t anchor(
      const quill::execution::call_context& context,
      const quill::schema::anchor_release_t& request);

  /// Move a PENDING release to ACCEPTED or REJECTED.
  ///
  /// Allowed for the governance authority, the DAO executor of the release
  /// context, or a RELEASE delegate of the governance authority.
  quill::schema::operation_result_t set_governance_status(
      const quill::execution::call_context& context,
      const quill::schema::set_governance_status_t& request);

  quill::schema::operation_result_t accept(
      const quill::execution::call_context& context,
      const quill::schema::release_id_t& release_id);

  quill::schema::operation_result_t reject(
      const quill::execution::call_context& context,
      const quill::schema::release_id_t& release_id);

  quill::schema::operation_result_t revoke(
      const quill::execution::call_context& context,
      const quill::schema::revoke_release_t& request);

  quill::schema::operation_result_t supersede(
      const quill::execution::call_context& context,
      const quill::schema::supersede_release_t& request);

  quill::schema::operation_result_t set_dao_executor(
      const quill::execution::call_context& context,
      const quill::schema::set_dao_executor_t& request);

  /// Staging variants of the operations above. Each validates and puts its
  /// writes into `batch` without committing; a rejected call leaves `batch`
  /// as it was.
  quill::schema::operation_result_t anchor(
      const quill::execution::call_context& context,
      const quill::schema::anchor_release_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t set_governance_status(
      const quill::execution::call_context& context,
      const quill::schema::set_governance_status_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t revoke(
      const quill::execution::call_context& context,
      const quill::schema::revoke_release_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t supersede(
      const quill::execution::call_context& context,
      const quill::schema::supersede_release_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t set_dao_executor(
      const quill::execution::call_context& context,
      const quill::schema::set_dao_executor_t& request,
      quill::storage::write_batch& batch);

 private:
  bool may_govern(const quill::execution::call_context& context,
                  const quill::schema::release_state_t& release) const;

  void stage_release(quill::storage::write_batch& batch,
                     const quill::schema::release_state_t& release);

  quill::schema::operation_result_t fail(quill::schema::error_code code,
                                         std::string_view operation) const;

  quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>&
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage_;
  const quill::delegation::engine& delegation_;
  const quill::workspace::registry& workspace_;
  const quill::snapshot::registry& snapshots_;
};

}  // namespace quill::release
