#pragma once

#include <quill/delegation/engine.hpp>
#include <quill/execution/call_context.hpp>
#include <quill/release/registry.hpp>
#include <quill/repository/registry.hpp>
#include <quill/schema/capability.hpp>
#include <quill/schema/encoding/scale/encoder.hpp>
#include <quill/signing/digest.hpp>
#include <quill/snapshot/registry.hpp>
#include <quill/storage/rocksdb/storage.hpp>
#include <quill/testing/common.hpp>
#include <quill/testing/keyring.hpp>
#include <quill/workspace/registry.hpp>

#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace quill::testing {

using scale_encoder_t =
    quill::schema::encoding::encoder<quill::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kTestChainName{"quill-test"};

/// Temporary RocksDB with every component wired over it, in the order the
/// execution engine wires them. Signatures come from a `keyring`.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          const std::size_t identities = 8)
      : db_{db_prefix},
        keys_{identities},
        storage_{quill::storage::make_storage<
            quill::storage::rocksdb_storage_tag>(db_.path())},
        delegation_{encoder_, storage_,
                    quill::signing::make_delegation_domain(
                        quill::signing::make_chain_id(kTestChainName)),
                    keys_.recovery()},
        workspace_{encoder_, storage_,
                   quill::signing::make_workspace_domain(
                       quill::signing::make_chain_id(kTestChainName)),
                   keys_.recovery()},
        repositories_{encoder_, storage_, delegation_, workspace_},
        snapshots_{encoder_, storage_, delegation_, repositories_},
        releases_{encoder_, storage_, delegation_, workspace_, snapshots_} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;

  const keyring& keys() const { return keys_; }
  const quill::schema::address_t& id(const std::size_t index) const {
    return keys_.address(index);
  }

  scale_encoder_t& encoder() { return encoder_; }
  quill::storage::storage<quill::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }
  quill::delegation::engine& delegation() { return delegation_; }
  quill::workspace::registry& workspace() { return workspace_; }
  quill::repository::registry& repositories() { return repositories_; }
  quill::snapshot::registry& snapshots() { return snapshots_; }
  quill::release::registry& releases() { return releases_; }

  quill::execution::call_context as(
      const std::size_t index,
      const quill::schema::timestamp_seconds_t now = kNow) const {
    return quill::execution::call_context{.sender = id(index), .now = now};
  }

  /// Signed registration prepared against the principal's current nonce.
  quill::schema::register_grant_t make_grant(
      const std::size_t principal,
      const std::size_t relayer,
      const quill::schema::context_id_t& context,
      const quill::schema::scope_mask_t& mask,
      const quill::schema::timestamp_seconds_t expiry,
      const quill::schema::timestamp_seconds_t deadline = kNow + 3600) {
    auto request = quill::schema::register_grant_t{.principal = id(principal),
                                                   .relayer = id(relayer),
                                                   .context = context,
                                                   .scope_mask = mask,
                                                   .expiry = expiry,
                                                   .deadline = deadline};
    auto digest = quill::signing::make_digest(
        delegation_.domain(),
        quill::schema::delegate_authorization_t{
            .principal = request.principal,
            .relayer = request.relayer,
            .context = request.context,
            .scope_mask = request.scope_mask,
            .nonce = delegation_.nonce_of(request.principal),
            .expiry = request.expiry,
            .deadline = request.deadline});
    request.signature = keys_.sign(principal, digest);
    return request;
  }

  quill::schema::revoke_grant_with_sig_t make_revocation(
      const std::size_t principal,
      const std::size_t relayer,
      const quill::schema::context_id_t& context,
      const quill::schema::timestamp_seconds_t deadline = kNow + 3600) {
    auto request =
        quill::schema::revoke_grant_with_sig_t{.principal = id(principal),
                                               .relayer = id(relayer),
                                               .context = context,
                                               .deadline = deadline};
    auto digest = quill::signing::make_digest(
        delegation_.domain(),
        quill::schema::revoke_authorization_t{
            .principal = request.principal,
            .relayer = request.relayer,
            .context = request.context,
            .nonce = delegation_.nonce_of(request.principal),
            .deadline = request.deadline});
    request.signature = keys_.sign(principal, digest);
    return request;
  }

  /// Grant `mask` from `principal` to `relayer` until `expiry`.
  void delegate(const std::size_t principal,
                const std::size_t relayer,
                const quill::schema::context_id_t& context,
                const quill::schema::scope_mask_t& mask,
                const quill::schema::timestamp_seconds_t expiry = kNow + 86400) {
    auto result = delegation_.register_grant(
        as(relayer), make_grant(principal, relayer, context, mask, expiry));
    if (!result.ok()) {
      throw std::runtime_error{"fixture delegation failed"};
    }
  }

  /// Initialize `context` with `authority` as its first member.
  void init_workspace(const quill::schema::context_id_t& context,
                      const std::size_t authority) {
    auto result = workspace_.init_authority(
        as(authority),
        quill::schema::init_authority_t{.context = context,
                                        .authority = id(authority)});
    if (!result.ok()) {
      throw std::runtime_error{"fixture workspace init failed"};
    }
  }

  quill::schema::set_member_with_sig_t make_member_change(
      const std::size_t authority,
      const quill::schema::context_id_t& context,
      const std::size_t member,
      const bool is_member,
      const quill::schema::timestamp_seconds_t deadline = kNow + 3600) {
    auto request = quill::schema::set_member_with_sig_t{.context = context,
                                                        .member = id(member),
                                                        .is_member = is_member,
                                                        .deadline = deadline};
    auto digest = quill::signing::make_digest(
        workspace_.domain(),
        quill::schema::set_member_authorization_t{
            .context = context,
            .member = request.member,
            .is_member = is_member,
            .nonce = workspace_.nonce_of(id(authority)),
            .deadline = deadline});
    request.signature = keys_.sign(authority, digest);
    return request;
  }

  void add_member(const quill::schema::context_id_t& context,
                  const std::size_t authority,
                  const std::size_t member) {
    auto result = workspace_.set_member_with_sig(
        as(authority), make_member_change(authority, context, member, true));
    if (!result.ok()) {
      throw std::runtime_error{"fixture member add failed"};
    }
  }

  static constexpr quill::schema::timestamp_seconds_t kNow{1'700'000'000};

 private:
  temp_path db_;
  keyring keys_;
  scale_encoder_t encoder_;
  quill::storage::storage<quill::storage::rocksdb_storage_tag> storage_;
  quill::delegation::engine delegation_;
  quill::workspace::registry workspace_;
  quill::repository::registry repositories_;
  quill::snapshot::registry snapshots_;
  quill::release::registry releases_;
};

}  // namespace quill::testing
