#include <gtest/gtest.h>
#include <quill/testing/fixture.hpp>

namespace {

using quill::schema::capability_t;
using quill::schema::error_category;
using quill::schema::error_code;
using quill::testing::ledger_fixture;

constexpr std::size_t kAlice = 0;
constexpr std::size_t kBob = 1;
constexpr auto kNow = ledger_fixture::kNow;

class snapshot_registry : public ::testing::Test {
 protected:
  snapshot_registry() : ledger_{"quill_snapshot_registry"} {
    ledger_.init_workspace(context_, kAlice);
    auto claimed = ledger_.repositories().claim(
        ledger_.as(kAlice),
        quill::schema::claim_repository_t{.repository_id = repository_,
                                          .context = context_,
                                          .metadata = "repo",
                                          .owner = ledger_.id(kAlice)});
    if (!claimed.ok()) {
      throw std::runtime_error{"repository claim failed"};
    }
  }

  quill::schema::create_snapshot_t make_snapshot(const uint8_t root_seed) const {
    return quill::schema::create_snapshot_t{
        .repository_id = repository_,
        .context = context_,
        .commit_hash = quill::testing::make_hash(root_seed + 100),
        .merkle_root = quill::testing::make_hash(root_seed),
        .manifest_ref = "ipfs://manifest",
        .author = ledger_.id(kAlice)};
  }

  ledger_fixture ledger_;
  quill::schema::context_id_t context_{quill::testing::make_hash(7)};
  quill::schema::repository_id_t repository_{quill::testing::make_hash(40)};
};

}  // namespace

TEST_F(snapshot_registry, owner_creates_indexed_snapshots) {
  auto first = ledger_.snapshots().create(ledger_.as(kAlice), make_snapshot(1));
  ASSERT_TRUE(first.ok()) << first.log;
  ASSERT_EQ(first.events.size(), 1u);
  EXPECT_EQ(first.events[0].type, "SnapshotCreated");
  EXPECT_EQ(first.events[0].attribute("index"), "0");

  auto second =
      ledger_.snapshots().create(ledger_.as(kAlice, kNow + 5), make_snapshot(2));
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(second.events[0].attribute("index"), "1");
  EXPECT_EQ(ledger_.snapshots().snapshots_count(repository_), 2u);

  auto stored = ledger_.snapshots().snapshot_at(repository_, 1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->index, 1u);
  EXPECT_EQ(stored->merkle_root, quill::testing::make_hash(2));
  EXPECT_EQ(stored->commit_hash, quill::testing::make_hash(102));
  EXPECT_EQ(stored->author, ledger_.id(kAlice));
  EXPECT_EQ(stored->created_at, kNow + 5);
  EXPECT_EQ(stored->manifest_ref, "ipfs://manifest");

  EXPECT_FALSE(ledger_.snapshots().snapshot_at(repository_, 2).has_value());
}

TEST_F(snapshot_registry, lookup_by_root) {
  ASSERT_TRUE(
      ledger_.snapshots().create(ledger_.as(kAlice), make_snapshot(1)).ok());
  ASSERT_TRUE(
      ledger_.snapshots().create(ledger_.as(kAlice), make_snapshot(2)).ok());

  EXPECT_TRUE(
      ledger_.snapshots().exists(repository_, quill::testing::make_hash(1)));
  EXPECT_FALSE(
      ledger_.snapshots().exists(repository_, quill::testing::make_hash(3)));
  EXPECT_FALSE(ledger_.snapshots().exists(quill::testing::make_hash(41),
                                          quill::testing::make_hash(1)));

  auto first =
      ledger_.snapshots().snapshot_by_root(repository_, quill::testing::make_hash(1));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->index, 0u);
  EXPECT_FALSE(ledger_.snapshots()
                   .snapshot_by_root(repository_, quill::testing::make_hash(3))
                   .has_value());
}

TEST_F(snapshot_registry, merkle_roots_are_unique_per_repository) {
  ASSERT_TRUE(
      ledger_.snapshots().create(ledger_.as(kAlice), make_snapshot(1)).ok());
  auto duplicate =
      ledger_.snapshots().create(ledger_.as(kAlice), make_snapshot(1));
  EXPECT_EQ(duplicate.code, static_cast<uint32_t>(error_code::duplicate_root));
  EXPECT_EQ(duplicate.category(), error_category::precondition_failed);
  EXPECT_EQ(duplicate.codespace, quill::snapshot::kCodespace);
  EXPECT_EQ(ledger_.snapshots().snapshots_count(repository_), 1u);
}

TEST_F(snapshot_registry, snapshot_delegate_creates_for_owner) {
  auto request = make_snapshot(1);
  auto denied = ledger_.snapshots().create(ledger_.as(kBob), request);
  EXPECT_EQ(denied.code, static_cast<uint32_t>(error_code::not_authorized));

  ledger_.delegate(kAlice, kBob, context_,
                   quill::schema::make_scope_mask({capability_t::snapshot}));
  auto result = ledger_.snapshots().create(ledger_.as(kBob), request);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(ledger_.snapshots().snapshot_at(repository_, 0)->author,
            ledger_.id(kAlice));
}

TEST_F(snapshot_registry, author_must_own_repository) {
  auto request = make_snapshot(1);
  request.author = ledger_.id(kBob);
  auto result = ledger_.snapshots().create(ledger_.as(kBob), request);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::author_not_owner));
}

TEST_F(snapshot_registry, repository_must_be_claimed_in_context) {
  auto unknown = make_snapshot(1);
  unknown.repository_id = quill::testing::make_hash(41);
  EXPECT_EQ(ledger_.snapshots().create(ledger_.as(kAlice), unknown).code,
            static_cast<uint32_t>(error_code::repository_missing));

  auto elsewhere = make_snapshot(1);
  elsewhere.context = quill::testing::make_hash(8);
  EXPECT_EQ(ledger_.snapshots().create(ledger_.as(kAlice), elsewhere).code,
            static_cast<uint32_t>(error_code::repository_wrong_context));
}

TEST_F(snapshot_registry, zero_inputs_are_rejected) {
  auto no_root = make_snapshot(1);
  no_root.merkle_root = {};
  EXPECT_EQ(ledger_.snapshots().create(ledger_.as(kAlice), no_root).code,
            static_cast<uint32_t>(error_code::zero_identifier));

  auto no_context = make_snapshot(1);
  no_context.context = {};
  EXPECT_EQ(ledger_.snapshots().create(ledger_.as(kAlice), no_context).code,
            static_cast<uint32_t>(error_code::zero_context));

  auto no_author = make_snapshot(1);
  no_author.author = {};
  auto result = ledger_.snapshots().create(ledger_.as(kAlice), no_author);
  EXPECT_EQ(result.code, static_cast<uint32_t>(error_code::zero_identity));
  EXPECT_EQ(result.category(), error_category::invalid_input);
  EXPECT_EQ(ledger_.snapshots().snapshots_count(repository_), 0u);
}
