#include <gtest/gtest.h>
#include <quill/schema/error_code.hpp>
#include <quill/schema/operation_result.hpp>

using quill::schema::error_category;
using quill::schema::error_code;

TEST(error_code, every_code_has_one_category_and_a_log) {
  for (const auto& [name, code] : quill::schema::kErrorCodeMappings) {
    EXPECT_NE(quill::schema::category_of(code), error_category::none) << name;
    EXPECT_EQ(quill::schema::to_string(code), name);
  }
}

TEST(error_code, categories_match_condition_classes) {
  EXPECT_EQ(quill::schema::category_of(error_code::zero_context),
            error_category::invalid_input);
  EXPECT_EQ(quill::schema::category_of(error_code::self_supersession),
            error_category::invalid_input);
  EXPECT_EQ(quill::schema::category_of(error_code::bad_signer),
            error_category::signature_invalid);
  EXPECT_EQ(quill::schema::category_of(error_code::signature_expired),
            error_category::signature_expired);
  EXPECT_EQ(quill::schema::category_of(error_code::release_not_pending),
            error_category::precondition_failed);
  EXPECT_EQ(quill::schema::category_of(error_code::release_revoked),
            error_category::precondition_failed);
  EXPECT_EQ(quill::schema::category_of(error_code::not_governance),
            error_category::unauthorized);
}

TEST(error_code, failure_result_carries_code_log_and_codespace) {
  auto result =
      quill::schema::make_failure("quill.release", error_code::release_exists);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, 30u);
  EXPECT_EQ(result.log, "release exists");
  EXPECT_EQ(result.codespace, "quill.release");
  EXPECT_EQ(result.category(), error_category::precondition_failed);
  EXPECT_TRUE(result.events.empty());
}

TEST(error_code, success_result_has_no_category) {
  auto result = quill::schema::make_success(
      "quill.delegation",
      {quill::schema::make_event(
          "Revoked", {quill::schema::make_attribute("relayer", "0x01", true)})});
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.category(), error_category::none);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].attribute("relayer"), "0x01");
  EXPECT_FALSE(result.events[0].attribute("principal").has_value());
  EXPECT_TRUE(result.events[0].attributes[0].index);
}
