#include <spdlog/spdlog.h>
#include <quill/crypto/recover.hpp>
#include <quill/execution/engine.hpp>
#include <quill/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace quill::schema;

namespace {

query_result_t make_query_error(uint32_t code,
                                std::string_view log,
                                const bytes_view_t& data) {
  return query_result_t{.code = code,
                        .log = std::string{log},
                        .key = make_bytes(data),
                        .codespace = std::string{
                            quill::execution::kQueryCodespace}};
}

template <typename Encoder, typename T>
query_result_t make_query_value(Encoder& encoder,
                                const bytes_view_t& data,
                                const T& value) {
  return query_result_t{.code = 0,
                        .key = make_bytes(data),
                        .value = encoder.encode(value),
                        .codespace = std::string{
                            quill::execution::kQueryCodespace}};
}

}  // namespace

namespace quill::execution {

engine::engine(engine_options options)
    : engine(std::move(options), &quill::crypto::recover_signer) {
  if (!quill::crypto::available()) {
    spdlog::warn("secp256k1 is unavailable; every signature will be rejected");
  }
}

engine::engine(engine_options options, signer_recovery_t recover_signer)
    : options_{std::move(options)},
      chain_id_{quill::signing::make_chain_id(options_.chain_name)},
      storage_{quill::storage::make_storage<quill::storage::rocksdb_storage_tag>(
          options_.db_path)},
      delegation_{encoder_, storage_,
                  quill::signing::signing_domain_t{
                      .name = options_.delegation_domain,
                      .version = std::string{quill::signing::kDomainVersion},
                      .chain_id = chain_id_},
                  recover_signer},
      workspace_{encoder_, storage_,
                 quill::signing::signing_domain_t{
                     .name = options_.workspace_domain,
                     .version = std::string{quill::signing::kDomainVersion},
                     .chain_id = chain_id_},
                 recover_signer},
      repositories_{encoder_, storage_, delegation_, workspace_},
      snapshots_{encoder_, storage_, delegation_, repositories_},
      releases_{encoder_, storage_, delegation_, workspace_, snapshots_} {
  spdlog::info("Execution engine ready on '{}' for chain '{}' ({})",
               options_.db_path, options_.chain_name, to_hex(chain_id_));
}

operation_result_t engine::execute(const call_context& context,
                                   const request_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = quill::storage::write_batch{};
  auto result = stage_locked(context, request, batch);
  if (result.ok()) {
    storage_.commit(batch);
  }
  return result;
}

operation_result_t engine::stage(const call_context& context,
                                 const request_t& request,
                                 quill::storage::write_batch& batch) {
  auto lock = std::scoped_lock{mutex_};
  return stage_locked(context, request, batch);
}

void engine::commit(const quill::storage::write_batch& batch) {
  auto lock = std::scoped_lock{mutex_};
  storage_.commit(batch);
}

operation_result_t engine::stage_locked(const call_context& context,
                                        const request_t& request,
                                        quill::storage::write_batch& batch) {
  auto result = dispatch(context, request, batch);
  if (result.ok() && !result.events.empty()) {
    stage_events(batch, context, result.events);
  }
  return result;
}

operation_result_t engine::dispatch(const call_context& context,
                                    const request_t& request,
                                    quill::storage::write_batch& batch) {
  return std::visit(
      overloaded{
          [&](const register_grant_t& r) {
            return delegation_.register_grant(context, r, batch);
          },
          [&](const revoke_grant_t& r) {
            return delegation_.revoke(context, r, batch);
          },
          [&](const revoke_grant_with_sig_t& r) {
            return delegation_.revoke_with_sig(context, r, batch);
          },
          [&](const init_authority_t& r) {
            return workspace_.init_authority(context, r, batch);
          },
          [&](const set_authority_with_sig_t& r) {
            return workspace_.set_authority_with_sig(context, r, batch);
          },
          [&](const set_member_with_sig_t& r) {
            return workspace_.set_member_with_sig(context, r, batch);
          },
          [&](const leave_workspace_t& r) {
            return workspace_.leave(context, r, batch);
          },
          [&](const claim_repository_t& r) {
            return repositories_.claim(context, r, batch);
          },
          [&](const transfer_repository_t& r) {
            return repositories_.transfer(context, r, batch);
          },
          [&](const create_snapshot_t& r) {
            return snapshots_.create(context, r, batch);
          },
          [&](const anchor_release_t& r) {
            return releases_.anchor(context, r, batch);
          },
          [&](const set_governance_status_t& r) {
            return releases_.set_governance_status(context, r, batch);
          },
          [&](const revoke_release_t& r) {
            return releases_.revoke(context, r, batch);
          },
          [&](const supersede_release_t& r) {
            return releases_.supersede(context, r, batch);
          },
          [&](const set_dao_executor_t& r) {
            return releases_.set_dao_executor(context, r, batch);
          }},
      request);
}

void engine::stage_events(quill::storage::write_batch& batch,
                          const call_context& context,
                          const std::vector<event_t>& events) {
  auto next_id = load_next_event_id();
  for (const auto& event : events) {
    auto record = event_record_t{.event_id = next_id,
                                 .sender = context.sender,
                                 .recorded_at = context.now,
                                 .event = event};
    auto storage_key = key::make_event_key(next_id);
    batch.put(encoder_, storage_key, record);
    ++next_id;
  }
  auto sequence_key = key::make_event_sequence_key();
  batch.put(encoder_, sequence_key, next_id);
  spdlog::debug("Staged {} event(s); next event id {}", events.size(),
                next_id);
}

uint64_t engine::load_next_event_id() const {
  auto sequence_key = key::make_event_sequence_key();
  return storage_.get<uint64_t>(encoder_, sequence_key).value_or(1);
}

uint64_t engine::next_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return load_next_event_id();
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<event_record_t>{};
  auto last_id = load_next_event_id() - 1;
  from_id = std::max<uint64_t>(from_id, 1);
  to_id = std::min(to_id, last_id);
  for (auto id = from_id; id <= to_id; ++id) {
    auto storage_key = key::make_event_key(id);
    if (auto record = storage_.get<event_record_t>(encoder_, storage_key)) {
      result.push_back(std::move(*record));
    }
  }
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto records = events(std::get<0>(*range), std::get<1>(*range));
    return make_query_value(encoder_, data, records);
  }

  auto lock = std::scoped_lock{mutex_};
  if (path == "/engine/keyspaces") {
    auto prefixes = std::vector<std::string>{};
    prefixes.reserve(key::kEngineKeyspaces.size());
    for (const auto prefix : key::kEngineKeyspaces) {
      prefixes.emplace_back(prefix);
    }
    return make_query_value(encoder_, data, prefixes);
  }
  if (path == "/engine/chain_id") {
    return make_query_value(encoder_, data, chain_id_);
  }
  if (path == "/delegation/authorized") {
    auto args = encoder_.try_decode<
        std::tuple<address_t, address_t, hash32_t, context_id_t,
                   timestamp_seconds_t>>(data);
    if (!args) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    const auto& [principal, relayer, word, context, now] = *args;
    auto capability = capability_of(from_word(word));
    if (!capability) {
      return make_query_error(kQueryInvalidKey, "unknown capability", data);
    }
    auto authorized =
        delegation_.is_authorized(principal, relayer, *capability, context, now);
    return make_query_value(encoder_, data, authorized);
  }
  if (path == "/delegation/nonce") {
    auto principal = encoder_.try_decode<address_t>(data);
    if (!principal) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    return make_query_value(encoder_, data, delegation_.nonce_of(*principal));
  }
  if (path == "/delegation/grant") {
    auto args = encoder_.try_decode<
        std::tuple<address_t, address_t, context_id_t>>(data);
    if (!args) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto grant = delegation_.grant_of(std::get<0>(*args), std::get<1>(*args),
                                      std::get<2>(*args));
    if (!grant) {
      return make_query_error(kQueryNotFound, "grant not found", data);
    }
    return make_query_value(encoder_, data, *grant);
  }
  if (path == "/workspace/member") {
    auto args =
        encoder_.try_decode<std::tuple<context_id_t, address_t>>(data);
    if (!args) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto member = workspace_.is_member(std::get<0>(*args), std::get<1>(*args));
    return make_query_value(encoder_, data, member);
  }
  if (path == "/workspace/authority") {
    auto context = encoder_.try_decode<context_id_t>(data);
    if (!context) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    return make_query_value(encoder_, data, workspace_.authority_of(*context));
  }
  if (path == "/repository/state") {
    auto repository_id = encoder_.try_decode<repository_id_t>(data);
    if (!repository_id) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto repository = repositories_.repository_of(*repository_id);
    if (!repository) {
      return make_query_error(kQueryNotFound, "repository not found", data);
    }
    return make_query_value(encoder_, data, *repository);
  }
  if (path == "/snapshot/exists") {
    auto args =
        encoder_.try_decode<std::tuple<repository_id_t, hash32_t>>(data);
    if (!args) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto found = snapshots_.exists(std::get<0>(*args), std::get<1>(*args));
    return make_query_value(encoder_, data, found);
  }
  if (path == "/release/by_id") {
    auto release_id = encoder_.try_decode<release_id_t>(data);
    if (!release_id) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto release = releases_.release_by_id(*release_id);
    if (!release) {
      return make_query_error(kQueryNotFound, "release not found", data);
    }
    return make_query_value(encoder_, data, *release);
  }
  if (path == "/release/by_index") {
    auto args = encoder_.try_decode<std::tuple<project_id_t, uint64_t>>(data);
    if (!args) {
      return make_query_error(kQueryInvalidKey, "invalid key", data);
    }
    auto release =
        releases_.release_by_index(std::get<0>(*args), std::get<1>(*args));
    if (!release) {
      return make_query_error(kQueryNotFound, "release not found", data);
    }
    return make_query_value(encoder_, data, *release);
  }
  spdlog::debug("Unknown query path '{}'", path);
  return make_query_error(kQueryUnknownPath, "unknown query path", data);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

const quill::delegation::engine& engine::delegation() const {
  return delegation_;
}

const quill::workspace::registry& engine::workspace() const {
  return workspace_;
}

const quill::repository::registry& engine::repositories() const {
  return repositories_;
}

const quill::snapshot::registry& engine::snapshots() const {
  return snapshots_;
}

const quill::release::registry& engine::releases() const {
  return releases_;
}

}  // namespace quill::execution
