#include <gtest/gtest.h>

#include "domain/Matcher.h"
#include "test_support.h"

class ConditionTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx.now = test_now();
    msg = make_message("m1", mail_category::work);
    msg.sender = "Jane Doe";
    msg.sender_email = "Jane.Doe@Example.COM";
    msg.subject = "Quarterly Report";
    msg.body = std::string("Please review the attached figures.");
  }

  bool eval(const condition& c) const { return evaluate_condition(c, msg, ctx); }

  eval_context ctx;
  message msg;
};

TEST_F(ConditionTest, SenderContainsChecksNameAndAddressIgnoringCase) {
  EXPECT_TRUE(eval(sender_contains{"jane"}));
  EXPECT_TRUE(eval(sender_contains{"example.com"}));
  EXPECT_TRUE(eval(sender_contains{"DOE"}));
  EXPECT_FALSE(eval(sender_contains{"john"}));
}

TEST_F(ConditionTest, SenderIsComparesWholeAddress) {
  EXPECT_TRUE(eval(sender_is{"jane.doe@example.com"}));
  EXPECT_FALSE(eval(sender_is{"jane.doe@example"}));
  EXPECT_FALSE(eval(sender_is{"Jane Doe"}));
}

TEST_F(ConditionTest, SenderDomainMatchesAddressSuffix) {
  msg.sender_email = "user@EXAMPLE.com";
  EXPECT_TRUE(eval(sender_domain{"example.com"}));
  EXPECT_TRUE(eval(sender_domain{"Example.Com"}));

  msg.sender_email = "user@notexample.com";
  EXPECT_FALSE(eval(sender_domain{"example.com"}));

  msg.sender_email = "user@mail.example.com";
  EXPECT_FALSE(eval(sender_domain{"example.com"}));
}

TEST_F(ConditionTest, SubjectAndBodyContainIgnoreCase) {
  EXPECT_TRUE(eval(subject_contains{"quarterly"}));
  EXPECT_FALSE(eval(subject_contains{"invoice"}));
  EXPECT_TRUE(eval(body_contains{"ATTACHED"}));

  msg.body.reset();
  EXPECT_FALSE(eval(body_contains{"attached"}));
}

TEST_F(ConditionTest, EmptyTextNeverMatches) {
  EXPECT_FALSE(eval(sender_contains{""}));
  EXPECT_FALSE(eval(subject_contains{""}));
  EXPECT_FALSE(eval(body_contains{""}));
  EXPECT_FALSE(eval(sender_domain{""}));
}

TEST_F(ConditionTest, CategoryIs) {
  EXPECT_TRUE(eval(category_is{mail_category::work}));
  EXPECT_FALSE(eval(category_is{mail_category::bills}));

  msg.category.reset();
  EXPECT_FALSE(eval(category_is{mail_category::work}));
}

TEST_F(ConditionTest, AbsentPriorityFailsBothComparisons) {
  msg.priority.reset();
  EXPECT_FALSE(eval(priority_greater_than{0}));
  EXPECT_FALSE(eval(priority_less_than{11}));

  msg.priority = 5;
  EXPECT_TRUE(eval(priority_greater_than{4}));
  EXPECT_FALSE(eval(priority_greater_than{5}));
  EXPECT_TRUE(eval(priority_less_than{6}));
  EXPECT_FALSE(eval(priority_less_than{5}));
}

TEST_F(ConditionTest, AgeUsesCalendarDays) {
  // Earlier today, even hours ago, is zero days old.
  msg.received = local_time(2026, 3, 15, 0, 5);
  EXPECT_FALSE(eval(age_greater_than{0}));
  EXPECT_TRUE(eval(age_less_than{1}));

  // Late yesterday is one day old although less than 24 hours have passed.
  msg.received = local_time(2026, 3, 14, 23, 30);
  EXPECT_TRUE(eval(age_greater_than{0}));
  EXPECT_FALSE(eval(age_less_than{1}));

  msg.received = local_time(2026, 3, 7, 12, 0);
  EXPECT_TRUE(eval(age_greater_than{7}));
  EXPECT_FALSE(eval(age_greater_than{8}));
}

TEST_F(ConditionTest, ReadStateAndActionItems) {
  msg.read = false;
  EXPECT_TRUE(eval(is_unread{}));
  EXPECT_FALSE(eval(is_read{}));

  msg.read = true;
  EXPECT_FALSE(eval(is_unread{}));
  EXPECT_TRUE(eval(is_read{}));

  EXPECT_FALSE(eval(has_action_items{}));
  msg.action_items.push_back(action_item{action_item_kind::deadline, "Pay invoice", std::nullopt});
  EXPECT_TRUE(eval(has_action_items{}));
}

TEST_F(ConditionTest, AttachmentAndVipAreAlwaysFalse) {
  msg.sender_reputation = 1.0;
  msg.body = std::string("see attachment");
  EXPECT_FALSE(eval(has_attachment{}));
  EXPECT_FALSE(eval(sender_is_vip{}));
}

class RuleMatcherTest : public ::testing::Test {
protected:
  void SetUp() override { ctx.now = test_now(); }

  eval_context ctx;
};

TEST_F(RuleMatcherTest, EmptyConditionListNeverMatches) {
  message m = make_message("m1", mail_category::bills);
  rule r = make_rule("r1", 50, {}, {delete_message{}});

  r.match = match_mode::all;
  EXPECT_FALSE(rule_matches(r, m, ctx));
  r.match = match_mode::any;
  EXPECT_FALSE(rule_matches(r, m, ctx));
}

TEST_F(RuleMatcherTest, DisabledRuleNeverMatches) {
  message m = make_message("m1", mail_category::bills);
  rule r = make_rule("r1", 50, {category_is{mail_category::bills}}, {});
  EXPECT_TRUE(rule_matches(r, m, ctx));

  r.enabled = false;
  EXPECT_FALSE(rule_matches(r, m, ctx));
}

TEST_F(RuleMatcherTest, AllModeRequiresEveryCondition) {
  message m = make_message("m1", mail_category::marketing, local_time(2026, 3, 7));
  rule r = make_rule("r1", 50, {category_is{mail_category::marketing}, age_greater_than{7}}, {});
  EXPECT_TRUE(rule_matches(r, m, ctx));

  r.conditions.push_back(is_read{});
  EXPECT_FALSE(rule_matches(r, m, ctx));

  r.conditions = {has_attachment{}, category_is{mail_category::marketing}};
  EXPECT_FALSE(rule_matches(r, m, ctx));
}

TEST_F(RuleMatcherTest, AnyModeNeedsOneCondition) {
  message m = make_message("m1");
  m.read = true;
  m.priority = 9;

  rule r = make_rule("r1", 50, {is_unread{}, priority_greater_than{8}}, {}, match_mode::any);
  EXPECT_TRUE(rule_matches(r, m, ctx));

  m.priority = 8;
  EXPECT_FALSE(rule_matches(r, m, ctx));
}
