#pragma once

#include "Matcher.h"
#include "Message.h"
#include "Rule.h"
#include "Stats.h"

#include "../infra/MailMutator.h"
#include "../infra/Notifier.h"
#include "../infra/Storage.h"

#include <ctime>
#include <functional>
#include <string>
#include <vector>

using clock_fn = std::function<std::time_t()>;

struct engine_options {
  int workers = 1;
  bool seed_default_rules = true;
  clock_fn clock;
};

struct rule_test_result {
  int matches = 0;
  int total = 0;
};

// Owns the prioritized rule list and the cumulative statistics. Collaborators
// are borrowed and may be null: without a store nothing is persisted, without
// a mutator side-effect requests are only reported.
//
// Not thread-safe; CRUD must not overlap with run().
class rule_engine {
public:
  rule_engine(kv_store* store, mail_mutator* mutator, notifier* notifier_ptr,
              engine_options opts = engine_options());

  void load();

  run_result run(std::vector<message> batch);
  rule_test_result test_rule(const rule& r, const std::vector<message>& batch) const;

  void add_rule(rule r);
  bool update_rule(const rule& r);
  bool delete_rule(const std::string& id);
  bool toggle_rule(const std::string& id);
  bool move_rule(size_t from, size_t to);

  std::string export_rules() const;
  bool import_rules(const std::string& text, std::string* err);

  const std::vector<rule>& rules() const { return rule_list; }
  const run_statistics& statistics() const { return stats; }
  const std::vector<execution_result>& last_results() const { return results; }

  static const char* rules_key;
  static const char* statistics_key;

private:
  struct record_pass {
    bool matched = false;
    int applied = 0;
    std::vector<side_effect> effects;
    std::vector<std::string> errors;
  };

  std::time_t now() const;
  void pass_record(const rule& r, message& msg, record_pass& out, const eval_context& ctx) const;
  void process_records(const rule& r, std::vector<message>& batch,
                       std::vector<record_pass>& passes, const eval_context& ctx) const;
  bool dispatch(const side_effect& fx, std::string& err);

  void sort_rules();
  void refresh_counts();
  void save_rules();
  void save_statistics();
  void seed_defaults();
  rule* find_rule(const std::string& id);

  kv_store* store;
  mail_mutator* mutator;
  notifier* notifier_ptr;
  engine_options opts;

  std::vector<rule> rule_list;
  run_statistics stats;
  std::vector<execution_result> results;
};
