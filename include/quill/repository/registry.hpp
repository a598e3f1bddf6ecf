#pragma once

#include <quill/delegation/engine.hpp>
#include <quill/execution/call_context.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/schema/repository_requests.hpp>
#include <quill/schema/repository_state.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <quill/workspace/registry.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace quill::repository {

inline constexpr std::string_view kCodespace{"quill.repository"};

/// Repository claims. A repository is claimed once by a workspace member (or
/// their CLAIM delegate) and moves between owners and contexts by transfer.
class registry final {
 public:
  registry(
      quill::schema::encoding::encoder<
          quill::schema::encoding::scale_encoder_tag>& encoder,
      quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage,
      const quill::delegation::engine& delegation,
      const quill::workspace::registry& workspace);

  std::optional<quill::schema::repository_state_t> repository_of(
      const quill::schema::repository_id_t& repository_id) const;

  bool is_claimed(const quill::schema::repository_id_t& repository_id) const;

  /// Zero address for unclaimed repositories.
  quill::schema::address_t owner_of(
      const quill::schema::repository_id_t& repository_id) const;

  std::vector<quill::schema::address_t> owners_of(
      const std::vector<quill::schema::repository_id_t>& repository_ids) const;

  std::vector<quill::schema::repository_id_t> repositories_of(
      const quill::schema::address_t& owner) const;

  quill::schema::operation_result_t claim(
      const quill::execution::call_context& context,
      const quill::schema::claim_repository_t& request);

  quill::schema::operation_result_t transfer(
      const quill::execution::call_context& context,
      const quill::schema::transfer_repository_t& request);

  /// Staging variants of the operations above. Each validates and puts its
  /// writes into `batch` without committing; a rejected call leaves `batch`
  /// as it was.
  quill::schema::operation_result_t claim(
      const quill::execution::call_context& context,
      const quill::schema::claim_repository_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t transfer(
      const quill::execution::call_context& context,
      const quill::schema::transfer_repository_t& request,
      quill::storage::write_batch& batch);

 private:
  quill::schema::operation_result_t reject(quill::schema::error_code code,
                                           std::string_view operation) const;

  quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>&
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage_;
  const quill::delegation::engine& delegation_;
  const quill::workspace::registry& workspace_;
};

}  // namespace quill::repository
