#include <gtest/gtest.h>

#include "domain/ActionExecutor.h"
#include "test_support.h"

class ActionExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    msg = make_message("m1", mail_category::other);
    msg.subject = "Server down";
  }

  message msg;
};

TEST_F(ActionExecutorTest, SetPriorityClampsToValidRange) {
  apply_action(set_priority{15}, msg);
  EXPECT_EQ(msg.priority.value_or(0), 10);

  apply_action(set_priority{-3}, msg);
  EXPECT_EQ(msg.priority.value_or(0), 1);

  auto out = apply_action(set_priority{7}, msg);
  EXPECT_EQ(msg.priority.value_or(0), 7);
  EXPECT_FALSE(out.stop);
  EXPECT_FALSE(out.effect.has_value());
}

TEST_F(ActionExecutorTest, SetCategoryWritesRecord) {
  apply_action(set_category{mail_category::bills}, msg);
  ASSERT_TRUE(msg.category.has_value());
  EXPECT_EQ(*msg.category, mail_category::bills);
}

TEST_F(ActionExecutorTest, ReadFlagChangesAreMirroredAsRequests) {
  auto out = apply_action(mark_read{}, msg);
  EXPECT_TRUE(msg.read);
  ASSERT_TRUE(out.effect.has_value());
  EXPECT_EQ(out.effect->kind, side_effect_kind::mark_read);
  EXPECT_EQ(out.effect->ref, "<m1@test>");

  out = apply_action(mark_unread{}, msg);
  EXPECT_FALSE(msg.read);
  ASSERT_TRUE(out.effect.has_value());
  EXPECT_EQ(out.effect->kind, side_effect_kind::mark_unread);
}

TEST_F(ActionExecutorTest, MailStoreActionsOnlyEmitRequests) {
  const std::string before = messages_dump({msg});

  auto del = apply_action(delete_message{}, msg);
  ASSERT_TRUE(del.effect.has_value());
  EXPECT_EQ(del.effect->kind, side_effect_kind::remove);
  EXPECT_EQ(del.effect->message_id, "m1");

  auto arc = apply_action(archive_message{}, msg);
  ASSERT_TRUE(arc.effect.has_value());
  EXPECT_EQ(arc.effect->kind, side_effect_kind::archive);

  auto mv = apply_action(move_to_mailbox{"Receipts"}, msg);
  ASSERT_TRUE(mv.effect.has_value());
  EXPECT_EQ(mv.effect->kind, side_effect_kind::move);
  EXPECT_EQ(mv.effect->argument, "Receipts");

  auto tag = apply_action(add_tag{"follow-up"}, msg);
  ASSERT_TRUE(tag.effect.has_value());
  EXPECT_EQ(tag.effect->kind, side_effect_kind::add_tag);
  EXPECT_EQ(tag.effect->argument, "follow-up");

  EXPECT_EQ(messages_dump({msg}), before);
}

TEST_F(ActionExecutorTest, SnoozeSetsFlagAndDate) {
  std::time_t until = local_time(2026, 3, 20, 8, 0);
  auto out = apply_action(snooze_until{until}, msg);
  EXPECT_TRUE(msg.snoozed);
  ASSERT_TRUE(msg.snooze_until.has_value());
  EXPECT_EQ(*msg.snooze_until, until);
  EXPECT_FALSE(out.effect.has_value());
}

TEST_F(ActionExecutorTest, NotifyBuildsTitleFromSubject) {
  auto out = apply_action(notify_user{"check the pager"}, msg);
  ASSERT_TRUE(out.effect.has_value());
  EXPECT_EQ(out.effect->kind, side_effect_kind::notify);
  EXPECT_EQ(out.effect->title, "Rule: Server down");
  EXPECT_EQ(out.effect->argument, "check the pager");
}

TEST_F(ActionExecutorTest, StopProcessingRaisesStop) {
  auto out = apply_action(stop_processing{}, msg);
  EXPECT_TRUE(out.stop);
  EXPECT_FALSE(out.effect.has_value());
}

TEST(RuleDisplayTest, NamesAndSummary) {
  EXPECT_EQ(condition_display_name(age_greater_than{1}), "Older than 1 day");
  EXPECT_EQ(condition_display_name(age_less_than{3}), "Newer than 3 days");
  EXPECT_EQ(condition_display_name(sender_domain{"example.com"}), "Sender domain is 'example.com'");
  EXPECT_EQ(condition_display_name(category_is{mail_category::newsletters}), "Category is Newsletters");
  EXPECT_EQ(action_display_name(move_to_mailbox{"Archive"}), "Move to 'Archive'");
  EXPECT_EQ(action_display_name(stop_processing{}), "Stop processing rules");

  rule r = make_rule("r1", 50, {is_unread{}}, {mark_read{}, archive_message{}});
  EXPECT_EQ(r.describe(), "1 condition, 2 actions");
  EXPECT_TRUE(r.is_valid());
  EXPECT_TRUE(is_destructive(action{delete_message{}}));
  EXPECT_FALSE(is_destructive(action{archive_message{}}));

  r.actions.clear();
  EXPECT_FALSE(r.is_valid());
}

TEST(RuleDisplayTest, GeneratedIdsAreUnique) {
  std::string a = make_rule_id();
  std::string b = make_rule_id();
  EXPECT_EQ(a.size(), 36u);
  EXPECT_NE(a, b);
}
