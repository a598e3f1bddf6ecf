#pragma once

#include <quill/delegation/engine.hpp>
#include <quill/execution/call_context.hpp>
#include <quill/repository/registry.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/schema/repository_requests.hpp>
#include <quill/schema/snapshot_state.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quill::snapshot {

inline constexpr std::string_view kCodespace{"quill.snapshot"};

/// Per-repository snapshot list. Merkle roots are unique within a repository;
/// the root index stores `index + 1` so that a zero lookup means absent.
class registry final {
 public:
  registry(
      quill::schema::encoding::encoder<
          quill::schema::encoding::scale_encoder_tag>& encoder,
      quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
      const quill::delegation::engine& delegation,
      const quill::repository::registry& repositories);

  bool exists(const quill::schema::repository_id_t& repository_id,
              const quill::schema::hash32_t& merkle_root) const;

  uint64_t snapshots_count(
      const quill::schema::repository_id_t& repository_id) const;

  std::optional<quill::schema::snapshot_state_t> snapshot_at(
      const quill::schema::repository_id_t& repository_id,
      uint64_t index) const;

  std::optional<quill::schema::snapshot_state_t> snapshot_by_root(
      const quill::schema::repository_id_t& repository_id,
      const quill::schema::hash32_t& merkle_root) const;

  quill::schema::operation_result_t create(
      const quill::execution::call_context& context,
      const quill::schema::create_snapshot_t& request);

  /// Staging variants of the operations above. Each validates and puts its
  /// writes into `batch` without committing; a rejected call leaves `batch`
  /// as it was.
  quill::schema::operation_result_t create(
      const quill::execution::call_context& context,
      const quill::schema::create_snapshot_t& request,
      quill::storage::write_batch& batch);

 private:
  quill::schema::operation_result_t reject(quill::schema::error_code code,
                                           std::string_view operation) const;

  quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>&
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage_;
  const quill::delegation::engine& delegation_;
  const quill::repository::registry& repositories_;
};

}  // namespace quill::snapshot
