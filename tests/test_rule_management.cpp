#include <gtest/gtest.h>

#include "domain/RuleEngine.h"
#include "infra/Storage.h"
#include "test_support.h"

#include <memory>

namespace {

class broken_store : public kv_store {
public:
  bool load(const std::string&, std::string&, std::string& err) override {
    err = "disk unavailable";
    return false;
  }
  bool save(const std::string&, const std::string&, std::string& err) override {
    err = "disk unavailable";
    return false;
  }
};

std::vector<std::string> ids_of(const rule_engine& e) {
  std::vector<std::string> ids;
  for (const auto& r : e.rules()) ids.push_back(r.id);
  return ids;
}

}  // namespace

class RuleManagementTest : public ::testing::Test {
protected:
  void SetUp() override { store.reset(make_memory_store()); }

  std::unique_ptr<rule_engine> make_engine(bool seed = false, kv_store* backing = nullptr) {
    engine_options opts;
    opts.seed_default_rules = seed;
    opts.clock = []() { return test_now(); };
    auto e = std::make_unique<rule_engine>(backing ? backing : store.get(), nullptr, nullptr, opts);
    e->load();
    return e;
  }

  std::unique_ptr<kv_store> store;
};

TEST_F(RuleManagementTest, SeedsDefaultRulesWhenNothingIsStored) {
  auto engine = make_engine(true);

  ASSERT_EQ(engine->rules().size(), 3u);
  EXPECT_EQ(engine->rules()[0].name, "Prioritize bills");
  EXPECT_EQ(engine->rules()[0].priority, 95);
  EXPECT_EQ(engine->rules()[1].name, "Auto-delete old marketing");
  EXPECT_EQ(engine->rules()[2].name, "Mark newsletters as read");
  EXPECT_EQ(engine->statistics().total_rules, 3);
  EXPECT_EQ(engine->statistics().enabled_rules, 3);

  std::string text;
  std::string err;
  EXPECT_TRUE(store->load(rule_engine::rules_key, text, err));
}

TEST_F(RuleManagementTest, StartsEmptyWithoutSeeding) {
  auto engine = make_engine(false);
  EXPECT_TRUE(engine->rules().empty());
  EXPECT_EQ(engine->statistics().total_rules, 0);
}

TEST_F(RuleManagementTest, CorruptStoredRulesFallBackToDefaults) {
  std::string err;
  ASSERT_TRUE(store->save(rule_engine::rules_key, "{not json", err));
  ASSERT_TRUE(store->save(rule_engine::statistics_key, "[1, 2", err));

  auto engine = make_engine(true);
  EXPECT_EQ(engine->rules().size(), 3u);
  EXPECT_EQ(engine->statistics().total_executions, 0);
}

TEST_F(RuleManagementTest, BrokenStoreKeepsEngineUsable) {
  broken_store broken;
  auto engine = make_engine(true, &broken);
  EXPECT_EQ(engine->rules().size(), 3u);

  engine->add_rule(make_rule("x", 10, {is_unread{}}, {mark_read{}}));
  auto res = engine->run({make_message("m1")});
  EXPECT_TRUE(res.messages[0].read);
  EXPECT_EQ(engine->statistics().total_executions, 4);
}

TEST_F(RuleManagementTest, RulesAndStatisticsSurviveReload) {
  {
    auto engine = make_engine();
    engine->add_rule(make_rule("keep", 60, {subject_contains{"report"}}, {move_to_mailbox{"Reports"}}));
    message m = make_message("m1");
    m.subject = "Monthly report";
    engine->run({m});
  }

  auto reloaded = make_engine();
  ASSERT_EQ(reloaded->rules().size(), 1u);
  EXPECT_EQ(reloaded->rules()[0].id, "keep");
  EXPECT_EQ(reloaded->rules()[0].execution_count, 1);
  EXPECT_EQ(reloaded->statistics().total_executions, 1);
  EXPECT_EQ(reloaded->statistics().duration_samples, 1);
  EXPECT_EQ(reloaded->statistics().total_rules, 1);
}

TEST_F(RuleManagementTest, AddKeepsPriorityOrderAndInsertionOrderForTies) {
  auto engine = make_engine();
  engine->add_rule(make_rule("a", 50, {is_read{}}, {}));
  engine->add_rule(make_rule("b", 70, {is_read{}}, {}));
  engine->add_rule(make_rule("c", 50, {is_read{}}, {}));
  engine->add_rule(make_rule("d", 50, {is_read{}}, {}));

  EXPECT_EQ(ids_of(*engine), (std::vector<std::string>{"b", "a", "c", "d"}));
}

TEST_F(RuleManagementTest, AddFillsIdAndTimestamps) {
  auto engine = make_engine();
  rule r = make_rule("", 50, {is_read{}}, {});
  engine->add_rule(r);

  ASSERT_EQ(engine->rules().size(), 1u);
  EXPECT_FALSE(engine->rules()[0].id.empty());
  EXPECT_EQ(engine->rules()[0].created_at, test_now());
  EXPECT_EQ(engine->rules()[0].last_modified, test_now());
}

TEST_F(RuleManagementTest, UpdateResortsAndKeepsExecutionCount) {
  auto engine = make_engine();
  engine->add_rule(make_rule("a", 80, {is_unread{}}, {mark_read{}}));
  engine->add_rule(make_rule("b", 40, {is_unread{}}, {}));
  engine->run({make_message("m1")});

  rule changed = engine->rules()[0];
  changed.priority = 10;
  changed.execution_count = 0;
  changed.name = "renamed";
  EXPECT_TRUE(engine->update_rule(changed));

  EXPECT_EQ(ids_of(*engine), (std::vector<std::string>{"b", "a"}));
  EXPECT_EQ(engine->rules()[1].name, "renamed");
  EXPECT_EQ(engine->rules()[1].execution_count, 1);

  EXPECT_FALSE(engine->update_rule(make_rule("missing", 1, {}, {})));
}

TEST_F(RuleManagementTest, DeleteAndToggleRefreshCounts) {
  auto engine = make_engine();
  engine->add_rule(make_rule("a", 80, {is_unread{}}, {}));
  engine->add_rule(make_rule("b", 40, {is_unread{}}, {}));

  EXPECT_TRUE(engine->toggle_rule("a"));
  EXPECT_FALSE(engine->rules()[0].enabled);
  EXPECT_EQ(engine->statistics().enabled_rules, 1);
  EXPECT_EQ(engine->statistics().total_rules, 2);

  EXPECT_TRUE(engine->delete_rule("b"));
  EXPECT_EQ(engine->statistics().enabled_rules, 0);
  EXPECT_EQ(engine->statistics().total_rules, 1);

  EXPECT_FALSE(engine->delete_rule("b"));
  EXPECT_FALSE(engine->toggle_rule("nope"));
}

TEST_F(RuleManagementTest, MoveReassignsDistinctPriorities) {
  auto engine = make_engine();
  engine->add_rule(make_rule("a", 50, {is_unread{}}, {}));
  engine->add_rule(make_rule("b", 50, {is_unread{}}, {}));
  engine->add_rule(make_rule("c", 50, {is_unread{}}, {}));

  EXPECT_TRUE(engine->move_rule(2, 0));
  EXPECT_EQ(ids_of(*engine), (std::vector<std::string>{"c", "a", "b"}));
  EXPECT_EQ(engine->rules()[0].priority, 100);
  EXPECT_EQ(engine->rules()[1].priority, 99);
  EXPECT_EQ(engine->rules()[2].priority, 98);

  EXPECT_TRUE(engine->move_rule(0, 2));
  EXPECT_EQ(ids_of(*engine), (std::vector<std::string>{"a", "b", "c"}));

  EXPECT_FALSE(engine->move_rule(3, 0));
}

TEST_F(RuleManagementTest, CrudLeavesRunHistoryAlone) {
  auto engine = make_engine();
  engine->add_rule(make_rule("a", 80, {is_unread{}}, {mark_read{}}));
  engine->run({make_message("m1")});
  const run_statistics before = engine->statistics();

  engine->add_rule(make_rule("b", 40, {is_unread{}}, {}));
  engine->toggle_rule("b");
  engine->move_rule(1, 0);
  engine->delete_rule("b");

  EXPECT_EQ(engine->statistics().total_executions, before.total_executions);
  EXPECT_EQ(engine->statistics().duration_samples, before.duration_samples);
  EXPECT_DOUBLE_EQ(engine->statistics().avg_execution_time, before.avg_execution_time);
  EXPECT_EQ(engine->rules()[0].execution_count, 1);
}

TEST_F(RuleManagementTest, ImportReplacesRuleSet) {
  auto engine = make_engine();
  engine->add_rule(make_rule("old", 50, {is_unread{}}, {}));

  const std::string text = R"([
    {"id": "x", "name": "Low", "priority": 10, "matchType": "any",
     "conditions": [{"type": "isRead"}], "actions": [{"type": "archive"}]},
    {"id": "y", "name": "High", "priority": 90,
     "conditions": [{"type": "senderDomain", "value": "example.com"}],
     "actions": [{"type": "notify", "message": "hi"}]}
  ])";
  std::string err;
  ASSERT_TRUE(engine->import_rules(text, &err)) << err;

  EXPECT_EQ(ids_of(*engine), (std::vector<std::string>{"y", "x"}));
  EXPECT_EQ(engine->rules()[1].match, match_mode::any);
  EXPECT_EQ(engine->statistics().total_rules, 2);
}

TEST_F(RuleManagementTest, MalformedImportLeavesRulesUntouched) {
  auto engine = make_engine();
  engine->add_rule(make_rule("old", 50, {is_unread{}}, {}));
  const std::string before = engine->export_rules();

  const std::string text = R"([
    {"id": "ok", "name": "Fine", "conditions": [{"type": "isRead"}], "actions": []},
    {"id": "bad", "name": "Broken", "conditions": [{"type": "senderMood", "value": "grumpy"}], "actions": []}
  ])";
  std::string err;
  EXPECT_FALSE(engine->import_rules(text, &err));
  EXPECT_NE(err.find("senderMood"), std::string::npos);
  EXPECT_EQ(engine->export_rules(), before);

  EXPECT_FALSE(engine->import_rules("not json at all", &err));
  EXPECT_EQ(engine->export_rules(), before);
}

TEST_F(RuleManagementTest, ExportThenImportIsLossless) {
  auto source = make_engine(true);
  source->add_rule(make_rule("extra", 20, {age_less_than{2}, sender_is{"boss@example.com"}},
                             {snooze_until{local_time(2026, 4, 1, 8)}, add_tag{"later"}}, match_mode::any));
  const std::string exported = source->export_rules();

  std::unique_ptr<kv_store> other(make_memory_store());
  auto target = make_engine(false, other.get());
  ASSERT_TRUE(target->import_rules(exported, nullptr));
  EXPECT_EQ(target->export_rules(), exported);
}

TEST_F(RuleManagementTest, InvalidUtf8RuleTextIsSavedWithReplacement) {
  auto engine = make_engine();
  engine->add_rule(make_rule("cafe", 70, {category_is{mail_category::bills}},
                             {add_tag{"caf\xe9"}, move_to_mailbox{"Caf\xe9"}}));
  ASSERT_EQ(engine->rules().size(), 1u);
  rule renamed = engine->rules()[0];
  renamed.name = "Caf\xe9 bills";
  EXPECT_TRUE(engine->update_rule(renamed));

  run_result out = engine->run({make_message("m1", mail_category::bills)});
  ASSERT_EQ(out.results.size(), 1u);
  EXPECT_TRUE(out.results[0].matched);
  EXPECT_EQ(engine->rules()[0].execution_count, 1);
  EXPECT_NE(run_result_to_json(out).find("Caf\xef\xbf\xbd"), std::string::npos);

  std::string text;
  std::string err;
  ASSERT_TRUE(store->load(rule_engine::rules_key, text, err)) << err;
  EXPECT_NE(text.find("Caf\xef\xbf\xbd bills"), std::string::npos);
  ASSERT_TRUE(store->load(rule_engine::statistics_key, text, err)) << err;

  EXPECT_TRUE(engine->toggle_rule("cafe"));
  EXPECT_TRUE(engine->move_rule(0, 0));
  EXPECT_NE(engine->export_rules().find("Caf\xef\xbf\xbd"), std::string::npos);
  EXPECT_TRUE(engine->delete_rule("cafe"));
}
