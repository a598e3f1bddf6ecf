#include <gtest/gtest.h>
#include <quill/schema/capability.hpp>
#include <quill/testing/fixture.hpp>

namespace {

using quill::schema::capability_t;
using quill::schema::error_category;
using quill::schema::error_code;
using quill::testing::ledger_fixture;

constexpr std::size_t kAlice = 0;
constexpr std::size_t kBob = 1;
constexpr std::size_t kCarol = 2;
constexpr auto kNow = ledger_fixture::kNow;

}  // namespace

TEST(delegation, snapshot_grant_authorizes_only_snapshot) {
  auto ledger = ledger_fixture{"quill_delegation_scenario_a"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(
      kAlice, kBob, context,
      quill::schema::make_scope_mask({capability_t::snapshot}), kNow + 3600);
  auto result = ledger.delegation().register_grant(ledger.as(kBob), request);
  ASSERT_TRUE(result.ok()) << result.log;

  auto& delegation = ledger.delegation();
  EXPECT_TRUE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                       capability_t::snapshot, context, kNow));
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                        capability_t::attest, context, kNow));
  EXPECT_EQ(delegation.nonce_of(ledger.id(kAlice)), 1u);
}

TEST(delegation, all_scopes_grant_authorizes_every_capability) {
  auto ledger = ledger_fixture{"quill_delegation_scenario_b"};
  auto context = quill::testing::make_hash(1);
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes());

  auto& delegation = ledger.delegation();
  EXPECT_TRUE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                       capability_t::claim, context, kNow));
  EXPECT_TRUE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                       capability_t::release, context, kNow));
  EXPECT_TRUE(delegation.is_authorized(
      ledger.id(kAlice), ledger.id(kBob),
      quill::schema::scope_mask_t{quill::schema::scope_mask_t{1} << 200},
      context, kNow));
}

TEST(delegation, exactly_the_granted_bits_authorize) {
  auto ledger = ledger_fixture{"quill_delegation_bits"};
  auto context = quill::testing::make_hash(1);
  auto mask = quill::schema::make_scope_mask(
      {capability_t::claim, capability_t::backup});
  ledger.delegate(kAlice, kBob, context, mask);

  for (const auto& [name, capability] : quill::schema::kCapabilityMappings) {
    auto granted = (mask & quill::schema::scope_of(capability)) != 0;
    EXPECT_EQ(ledger.delegation().is_authorized(
                  ledger.id(kAlice), ledger.id(kBob), capability, context, kNow),
              granted)
        << name;
  }
}

TEST(delegation, mask_missing_one_bit_is_not_a_wildcard) {
  auto ledger = ledger_fixture{"quill_delegation_near_all"};
  auto context = quill::testing::make_hash(1);
  auto mask = quill::schema::scope_mask_t{
      quill::schema::all_scopes() ^ quill::schema::scope_of(capability_t::attest)};
  ledger.delegate(kAlice, kBob, context, mask);

  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::attest, context, kNow));
  EXPECT_TRUE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::release, context, kNow));
}

TEST(delegation, grant_expires_at_expiry) {
  auto ledger = ledger_fixture{"quill_delegation_expiry"};
  auto context = quill::testing::make_hash(1);
  auto expiry = kNow + 100;
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes(), expiry);

  auto& delegation = ledger.delegation();
  EXPECT_TRUE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                       capability_t::claim, context,
                                       expiry - 1));
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                        capability_t::claim, context, expiry));
}

TEST(delegation, grants_do_not_leak_across_contexts) {
  auto ledger = ledger_fixture{"quill_delegation_contexts"};
  auto first = quill::testing::make_hash(1);
  auto second = quill::testing::make_hash(2);
  ledger.delegate(kAlice, kBob, first, quill::schema::all_scopes());

  auto& delegation = ledger.delegation();
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                        capability_t::claim, second, kNow));
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kBob),
                                        capability_t::claim,
                                        quill::schema::context_id_t{}, kNow));
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kAlice), ledger.id(kCarol),
                                        capability_t::claim, first, kNow));
  EXPECT_FALSE(delegation.is_authorized(ledger.id(kBob), ledger.id(kAlice),
                                        capability_t::claim, first, kNow));
}

TEST(delegation, replayed_registration_is_rejected) {
  auto ledger = ledger_fixture{"quill_delegation_replay"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow + 3600);
  ASSERT_TRUE(
      ledger.delegation().register_grant(ledger.as(kBob), request).ok());

  auto replay = ledger.delegation().register_grant(ledger.as(kCarol), request);
  EXPECT_EQ(replay.code, static_cast<uint32_t>(error_code::bad_signer));
  EXPECT_EQ(replay.category(), error_category::signature_invalid);
  EXPECT_EQ(replay.codespace, quill::delegation::kCodespace);
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 1u);
}

TEST(delegation, signature_from_other_identity_is_rejected) {
  auto ledger = ledger_fixture{"quill_delegation_forged"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow + 3600);
  auto forged = ledger.make_grant(kCarol, kBob, context,
                                  quill::schema::all_scopes(), kNow + 3600);
  request.signature = forged.signature;

  auto result = ledger.delegation().register_grant(ledger.as(kBob), request);
  EXPECT_EQ(result.category(), error_category::signature_invalid);
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 0u);
  EXPECT_FALSE(ledger.delegation()
                   .grant_of(ledger.id(kAlice), ledger.id(kBob), context)
                   .has_value());
}

TEST(delegation, unrecoverable_signature_is_rejected) {
  auto ledger = ledger_fixture{"quill_delegation_unrecoverable"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow + 3600);
  request.signature[64] = quill::testing::keyring::kUnrecoverable;
  auto result = ledger.delegation().register_grant(ledger.as(kBob), request);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::bad_signer));
}

TEST(delegation, deadline_is_inclusive) {
  auto ledger = ledger_fixture{"quill_delegation_deadline"};
  auto context = quill::testing::make_hash(1);
  auto late = ledger.make_grant(kAlice, kBob, context,
                                quill::schema::all_scopes(), kNow + 3600,
                                kNow - 1);
  auto expired = ledger.delegation().register_grant(ledger.as(kBob), late);
  EXPECT_EQ(expired.code, static_cast<uint32_t>(error_code::signature_expired));
  EXPECT_EQ(expired.category(), error_category::signature_expired);
  EXPECT_EQ(expired.log, "sig expired");
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 0u);

  auto on_time = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow + 3600,
                                   kNow);
  EXPECT_TRUE(
      ledger.delegation().register_grant(ledger.as(kBob), on_time).ok());
}

TEST(delegation, expiry_must_be_in_the_future) {
  auto ledger = ledger_fixture{"quill_delegation_bad_expiry"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow);
  auto result = ledger.delegation().register_grant(ledger.as(kBob), request);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::bad_expiry));
  EXPECT_EQ(result.category(), error_category::invalid_input);
}

TEST(delegation, zero_fields_are_invalid_input) {
  auto ledger = ledger_fixture{"quill_delegation_zero"};
  auto context = quill::testing::make_hash(1);

  auto no_principal = ledger.make_grant(kAlice, kBob, context,
                                        quill::schema::all_scopes(), kNow + 60);
  no_principal.principal = {};
  EXPECT_EQ(ledger.delegation().register_grant(ledger.as(kBob), no_principal)
                .code,
            static_cast<uint32_t>(error_code::zero_principal));

  auto no_relayer = ledger.make_grant(kAlice, kBob, context,
                                      quill::schema::all_scopes(), kNow + 60);
  no_relayer.relayer = {};
  EXPECT_EQ(
      ledger.delegation().register_grant(ledger.as(kBob), no_relayer).code,
      static_cast<uint32_t>(error_code::zero_relayer));

  auto no_context = ledger.make_grant(kAlice, kBob, {},
                                      quill::schema::all_scopes(), kNow + 60);
  auto result = ledger.delegation().register_grant(ledger.as(kBob), no_context);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::zero_context));
  EXPECT_EQ(result.category(), error_category::invalid_input);
}

TEST(delegation, revoke_is_idempotent) {
  auto ledger = ledger_fixture{"quill_delegation_revoke"};
  auto context = quill::testing::make_hash(1);
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes());

  auto request = quill::schema::revoke_grant_t{.relayer = ledger.id(kBob),
                                               .context = context};
  auto first = ledger.delegation().revoke(ledger.as(kAlice), request);
  EXPECT_TRUE(first.ok());
  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));

  auto second = ledger.delegation().revoke(ledger.as(kAlice), request);
  EXPECT_TRUE(second.ok());
  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));

  auto grant =
      ledger.delegation().grant_of(ledger.id(kAlice), ledger.id(kBob), context);
  ASSERT_TRUE(grant.has_value());
  EXPECT_EQ(grant->expiry, 0u);
  EXPECT_EQ(grant->scope_mask, 0);
}

TEST(delegation, revoke_only_touches_the_senders_grant) {
  auto ledger = ledger_fixture{"quill_delegation_revoke_sender"};
  auto context = quill::testing::make_hash(1);
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes());

  auto result = ledger.delegation().revoke(
      ledger.as(kCarol),
      quill::schema::revoke_grant_t{.relayer = ledger.id(kBob),
                                    .context = context});
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));
}

TEST(delegation, signed_revocation_consumes_nonce) {
  auto ledger = ledger_fixture{"quill_delegation_revoke_sig"};
  auto context = quill::testing::make_hash(1);
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes());

  auto revocation = ledger.make_revocation(kAlice, kBob, context);
  auto result =
      ledger.delegation().revoke_with_sig(ledger.as(kCarol), revocation);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 2u);
  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));

  auto replay =
      ledger.delegation().revoke_with_sig(ledger.as(kCarol), revocation);
  EXPECT_EQ(replay.category(), error_category::signature_invalid);
}

TEST(delegation, revocation_invalidates_prepared_registration) {
  auto ledger = ledger_fixture{"quill_delegation_shared_nonce"};
  auto context = quill::testing::make_hash(1);
  auto prepared = ledger.make_grant(kAlice, kBob, context,
                                    quill::schema::all_scopes(), kNow + 3600);
  auto revocation = ledger.make_revocation(kAlice, kCarol, context);
  ASSERT_TRUE(
      ledger.delegation().revoke_with_sig(ledger.as(kCarol), revocation).ok());

  auto result = ledger.delegation().register_grant(ledger.as(kBob), prepared);
  EXPECT_EQ(result.category(), error_category::signature_invalid);
  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));
}

TEST(delegation, expired_revocation_leaves_nonce) {
  auto ledger = ledger_fixture{"quill_delegation_revoke_expired"};
  auto context = quill::testing::make_hash(1);
  auto revocation = ledger.make_revocation(kAlice, kBob, context, kNow - 5);
  auto result =
      ledger.delegation().revoke_with_sig(ledger.as(kBob), revocation);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::signature_expired));
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 0u);
}

TEST(delegation, registration_overwrites_previous_grant) {
  auto ledger = ledger_fixture{"quill_delegation_overwrite"};
  auto context = quill::testing::make_hash(1);
  ledger.delegate(kAlice, kBob, context, quill::schema::all_scopes());
  ledger.delegate(kAlice, kBob, context,
                  quill::schema::make_scope_mask({capability_t::claim}));

  EXPECT_TRUE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::claim, context, kNow));
  EXPECT_FALSE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::release, context,
      kNow));
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 2u);
}

TEST(delegation, registration_emits_delegated_event) {
  auto ledger = ledger_fixture{"quill_delegation_event"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(
      kAlice, kBob, context,
      quill::schema::make_scope_mask({capability_t::release}), kNow + 10);
  auto result = ledger.delegation().register_grant(ledger.as(kBob), request);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  const auto& event = result.events[0];
  EXPECT_EQ(event.type, "Delegated");
  EXPECT_EQ(event.attribute("principal"),
            quill::schema::to_hex(ledger.id(kAlice)));
  EXPECT_EQ(event.attribute("relayer"), quill::schema::to_hex(ledger.id(kBob)));
  EXPECT_EQ(event.attribute("expiry"), std::to_string(kNow + 10));
  EXPECT_EQ(event.attribute("scopes"),
            quill::schema::to_hex(quill::schema::to_word(
                quill::schema::make_scope_mask({capability_t::release}))));
}

TEST(delegation, principal_always_acts_for_itself) {
  auto ledger = ledger_fixture{"quill_delegation_self"};
  auto context = quill::testing::make_hash(1);
  EXPECT_TRUE(ledger.delegation().can_act_for(
      ledger.as(kAlice), ledger.id(kAlice), capability_t::release, context));
  EXPECT_FALSE(ledger.delegation().can_act_for(
      ledger.as(kBob), ledger.id(kAlice), capability_t::release, context));
  ledger.delegate(kAlice, kBob, context,
                  quill::schema::make_scope_mask({capability_t::release}));
  EXPECT_TRUE(ledger.delegation().can_act_for(
      ledger.as(kBob), ledger.id(kAlice), capability_t::release, context));
}

TEST(delegation, staged_registration_waits_for_commit) {
  auto ledger = ledger_fixture{"quill_delegation_staged"};
  auto context = quill::testing::make_hash(1);
  auto request = ledger.make_grant(kAlice, kBob, context,
                                   quill::schema::all_scopes(), kNow + 3600);
  auto batch = quill::storage::write_batch{};
  auto result =
      ledger.delegation().register_grant(ledger.as(kBob), request, batch);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(batch.entries.size(), 2u);
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 0u);
  EXPECT_FALSE(ledger.delegation()
                   .grant_of(ledger.id(kAlice), ledger.id(kBob), context)
                   .has_value());

  ledger.storage().commit(batch);
  EXPECT_EQ(ledger.delegation().nonce_of(ledger.id(kAlice)), 1u);
  EXPECT_TRUE(ledger.delegation().is_authorized(
      ledger.id(kAlice), ledger.id(kBob), capability_t::backup, context, kNow));
}

TEST(delegation, signed_by_matches_recovered_address) {
  auto digest = quill::testing::make_hash(3);
  auto signature = quill::schema::signature_t{};
  auto address = quill::testing::make_address(1);
  EXPECT_FALSE(quill::execution::signed_by(
      quill::execution::signer_recovery_t{}, digest, signature, address));

  auto recover = [&](const quill::schema::hash32_t&,
                     const quill::schema::signature_t&)
      -> std::optional<quill::schema::address_t> { return address; };
  EXPECT_TRUE(quill::execution::signed_by(recover, digest, signature, address));
  EXPECT_FALSE(quill::execution::signed_by(
      recover, digest, signature, quill::testing::make_address(2)));
}
