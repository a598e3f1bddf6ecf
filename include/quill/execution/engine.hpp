#pragma once

#include <quill/delegation/engine.hpp>
#include <quill/execution/call_context.hpp>
#include <quill/execution/signer_recovery.hpp>
#include <quill/release/registry.hpp>
#include <quill/repository/registry.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/schema/event_record.hpp>
#include <quill/schema/operation_result.hpp>
#include <quill/schema/primitives.hpp>
#include <quill/schema/query_result.hpp>
#include <quill/schema/request.hpp>
#include <quill/signing/digest.hpp>
#include <quill/snapshot/registry.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <quill/workspace/registry.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace quill::execution {

inline constexpr std::string_view kQueryCodespace{"quill.query"};

/// Stable query error codes.
inline constexpr uint32_t kQueryInvalidKey{1};
inline constexpr uint32_t kQueryNotFound{2};
inline constexpr uint32_t kQueryUnknownPath{3};

struct engine_options final {
  std::string db_path;
  std::string chain_name{"quill-local"};
  std::string delegation_domain{quill::signing::kDelegationDomainName};
  std::string workspace_domain{quill::signing::kWorkspaceDomainName};
};

/// Provenance ledger state machine.
///
/// Owns the RocksDB store and one instance of each component wired over it.
/// Every call is serialized by one mutex. Successful mutations append their
/// events to a persistent log keyed by a monotonically increasing event id.
class engine final {
 public:
  /// Signatures are recovered with secp256k1 public key recovery.
  explicit engine(engine_options options);

  /// Signatures are recovered with the provided callback.
  engine(engine_options options, signer_recovery_t recover_signer);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Route a typed request to the component that owns it.
  ///
  /// Component writes, event records and the event sequence counter are
  /// committed together in one batch, or not at all.
  quill::schema::operation_result_t execute(
      const call_context& context,
      const quill::schema::request_t& request);

  /// Same as `execute` but stages everything into `batch` and leaves the
  /// commit to the caller. Requests staged into one batch see only committed
  /// state.
  quill::schema::operation_result_t stage(
      const call_context& context,
      const quill::schema::request_t& request,
      quill::storage::write_batch& batch);

  /// Apply a batch filled by `stage` atomically.
  void commit(const quill::storage::write_batch& batch);

  /// Execute a deterministic read-path query by route.
  ///
  /// `data` carries the SCALE-encoded route key and the result value is
  /// SCALE-encoded. Failures echo `data` back in `key`.
  quill::schema::query_result_t query(std::string_view path,
                                      const quill::schema::bytes_view_t& data);

  /// Event records with ids in the inclusive range [from_id, to_id].
  std::vector<quill::schema::event_record_t> events(uint64_t from_id,
                                                    uint64_t to_id) const;

  /// Id that the next recorded event will receive; ids start at 1.
  uint64_t next_event_id() const;

  const quill::schema::hash32_t& chain_id() const;

  const quill::delegation::engine& delegation() const;
  const quill::workspace::registry& workspace() const;
  const quill::repository::registry& repositories() const;
  const quill::snapshot::registry& snapshots() const;
  const quill::release::registry& releases() const;

 private:
  quill::schema::operation_result_t stage_locked(
      const call_context& context,
      const quill::schema::request_t& request,
      quill::storage::write_batch& batch);

  quill::schema::operation_result_t dispatch(
      const call_context& context,
      const quill::schema::request_t& request,
      quill::storage::write_batch& batch);

  void stage_events(quill::storage::write_batch& batch,
                    const call_context& context,
                    const std::vector<quill::schema::event_t>& events);

  uint64_t load_next_event_id() const;

  engine_options options_;
  quill::schema::hash32_t chain_id_{};
  mutable std::mutex mutex_;
  mutable quill::schema::encoding::encoder<
      quill::schema::encoding::scale_encoder_tag>
      encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag> storage_;
  quill::delegation::engine delegation_;
  quill::workspace::registry workspace_;
  quill::repository::registry repositories_;
  quill::snapshot::registry snapshots_;
  quill::release::registry releases_;
};

}  // namespace quill::execution
