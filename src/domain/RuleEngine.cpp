#include "RuleEngine.h"

#include "ActionExecutor.h"
#include "RuleJson.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

const char* rule_engine::rules_key = "rules";
const char* rule_engine::statistics_key = "rule_statistics";

namespace {

rule make_default_rule(const std::string& name,
                       std::vector<condition> conditions,
                       std::vector<action> actions,
                       int priority,
                       std::time_t now) {
  rule r;
  r.id = make_rule_id();
  r.name = name;
  r.conditions = std::move(conditions);
  r.actions = std::move(actions);
  r.priority = priority;
  r.match = match_mode::all;
  r.created_at = now;
  r.last_modified = now;
  return r;
}

std::string seconds_label(double sec) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << sec << "s";
  return ss.str();
}

}  // namespace

rule_engine::rule_engine(kv_store* store, mail_mutator* mutator, notifier* notifier_ptr,
                         engine_options opts)
  : store(store), mutator(mutator), notifier_ptr(notifier_ptr), opts(std::move(opts)) {}

std::time_t rule_engine::now() const {
  return opts.clock ? opts.clock() : std::time(nullptr);
}

void rule_engine::load() {
  std::string text;
  std::string err;
  bool loaded = false;

  if (store) {
    if (store->load(rules_key, text, err)) {
      std::vector<rule> decoded;
      if (rules_from_json(text, decoded, &err)) {
        rule_list = std::move(decoded);
        loaded = true;
      } else {
        std::cerr << "[rules] stored rules unreadable, using defaults: " << err << std::endl;
      }
    } else if (!err.empty()) {
      std::cerr << "[storage] loading rules failed: " << err << std::endl;
    }
  }

  if (!loaded) {
    rule_list.clear();
    if (opts.seed_default_rules) seed_defaults();
  }
  sort_rules();

  stats = run_statistics();
  text.clear();
  err.clear();
  if (store) {
    if (store->load(statistics_key, text, err)) {
      run_statistics decoded;
      if (statistics_from_json(text, decoded, &err)) {
        stats = decoded;
      } else {
        std::cerr << "[rules] stored statistics unreadable, starting fresh: " << err << std::endl;
      }
    } else if (!err.empty()) {
      std::cerr << "[storage] loading statistics failed: " << err << std::endl;
    }
  }
  refresh_counts();
}

void rule_engine::seed_defaults() {
  std::time_t t = now();
  rule_list.push_back(make_default_rule(
    "Auto-delete old marketing",
    {category_is{mail_category::marketing}, age_greater_than{7}},
    {delete_message{}},
    90, t));
  rule_list.push_back(make_default_rule(
    "Mark newsletters as read",
    {category_is{mail_category::newsletters}, age_greater_than{3}},
    {mark_read{}},
    80, t));
  rule_list.push_back(make_default_rule(
    "Prioritize bills",
    {category_is{mail_category::bills}},
    {set_priority{9}},
    95, t));
  sort_rules();
  save_rules();
}

void rule_engine::pass_record(const rule& r, message& msg, record_pass& out,
                              const eval_context& ctx) const {
  if (!rule_matches(r, msg, ctx)) return;
  out.matched = true;

  for (const auto& a : r.actions) {
    action_outcome outcome;
    try {
      outcome = apply_action(a, msg);
    } catch (const std::exception& e) {
      out.errors.push_back(std::string("Action failed: ") + e.what());
      continue;
    }

    if (outcome.effect) {
      out.effects.push_back(std::move(*outcome.effect));
    } else {
      out.applied++;
    }
    if (outcome.stop) break;
  }
}

void rule_engine::process_records(const rule& r, std::vector<message>& batch,
                                  std::vector<record_pass>& passes,
                                  const eval_context& ctx) const {
  auto work = [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) pass_record(r, batch[i], passes[i], ctx);
  };

  const size_t n = batch.size();
  const size_t workers = static_cast<size_t>(std::max(1, opts.workers));
  if (workers == 1 || n < 2) {
    work(0, n);
    return;
  }

  // Each worker owns a contiguous slice of record slots.
  const size_t chunk = (n + workers - 1) / workers;
  // A slice whose thread cannot be started runs on the calling thread.
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (size_t begin = 0; begin < n; begin += chunk) {
    const size_t end = std::min(n, begin + chunk);
    try {
      pool.emplace_back(work, begin, end);
    } catch (const std::system_error& e) {
      std::cerr << "[rules] worker start failed, running inline: " << e.what() << std::endl;
      work(begin, end);
    }
  }
  for (auto& t : pool) t.join();
}

bool rule_engine::dispatch(const side_effect& fx, std::string& err) {
  if (fx.kind == side_effect_kind::notify) {
    if (!notifier_ptr) return true;
    std::string notify_err;
    try {
      if (!notifier_ptr->notify(fx.title, fx.argument, notify_err)) {
        std::cerr << "[notify] " << notify_err << std::endl;
      }
    } catch (const std::exception& e) {
      std::cerr << "[notify] " << e.what() << std::endl;
    }
    return true;
  }

  if (!mutator) return true;
  try {
    return mutator->apply(fx, err);
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

run_result rule_engine::run(std::vector<message> batch) {
  run_result out;
  results.clear();

  std::vector<rule> enabled;
  for (const auto& r : rule_list) {
    if (r.enabled) enabled.push_back(r);
  }
  if (enabled.empty()) {
    out.messages = std::move(batch);
    return out;
  }

  const auto run_start = std::chrono::steady_clock::now();
  eval_context ctx;
  ctx.now = now();

  for (const auto& r : enabled) {
    const auto rule_start = std::chrono::steady_clock::now();

    std::vector<record_pass> passes(batch.size());
    process_records(r, batch, passes, ctx);

    execution_result res;
    res.rule_id = r.id;
    res.rule_name = r.name;
    for (auto& pass : passes) {
      if (!pass.matched) continue;
      res.matched = true;
      res.actions_executed += pass.applied;
      for (auto& e : pass.errors) res.errors.push_back(std::move(e));

      for (auto& fx : pass.effects) {
        fx.rule_id = r.id;
        std::string err;
        if (dispatch(fx, err)) {
          res.actions_executed++;
        } else {
          res.errors.push_back("Action failed: " + (err.empty() ? std::string("request rejected") : err));
        }
        out.side_effects.push_back(std::move(fx));
      }
    }

    if (res.matched) {
      if (rule* stored = find_rule(r.id)) stored->execution_count++;
    }

    res.duration_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - rule_start).count();
    out.results.push_back(std::move(res));
  }

  for (const auto& res : out.results) stats.record(res);
  stats.last_execution = ctx.now;
  results = out.results;

  save_rules();
  save_statistics();

  double total = std::chrono::duration<double>(std::chrono::steady_clock::now() - run_start).count();
  std::cout << "[rules] applied " << enabled.size() << " rules to " << batch.size()
            << " messages in " << seconds_label(total) << std::endl;

  out.messages = std::move(batch);
  return out;
}

rule_test_result rule_engine::test_rule(const rule& r, const std::vector<message>& batch) const {
  eval_context ctx;
  ctx.now = now();

  rule_test_result res;
  res.total = static_cast<int>(batch.size());
  for (const auto& msg : batch) {
    if (rule_matches(r, msg, ctx)) res.matches++;
  }
  return res;
}

void rule_engine::add_rule(rule r) {
  std::time_t t = now();
  if (r.id.empty()) r.id = make_rule_id();
  if (r.created_at == 0) r.created_at = t;
  r.last_modified = t;
  rule_list.push_back(std::move(r));

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
}

bool rule_engine::update_rule(const rule& r) {
  rule* existing = find_rule(r.id);
  if (!existing) return false;

  rule updated = r;
  updated.created_at = existing->created_at;
  updated.execution_count = existing->execution_count;
  updated.last_modified = now();
  *existing = std::move(updated);

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
  return true;
}

bool rule_engine::delete_rule(const std::string& id) {
  auto it = std::remove_if(rule_list.begin(), rule_list.end(),
                           [&id](const rule& r) { return r.id == id; });
  if (it == rule_list.end()) return false;
  rule_list.erase(it, rule_list.end());

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
  return true;
}

bool rule_engine::toggle_rule(const std::string& id) {
  rule* r = find_rule(id);
  if (!r) return false;
  r->enabled = !r->enabled;
  r->last_modified = now();

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
  return true;
}

bool rule_engine::move_rule(size_t from, size_t to) {
  if (from >= rule_list.size() || to >= rule_list.size()) return false;

  if (from < to) {
    std::rotate(rule_list.begin() + from, rule_list.begin() + from + 1, rule_list.begin() + to + 1);
  } else if (from > to) {
    std::rotate(rule_list.begin() + to, rule_list.begin() + from, rule_list.begin() + from + 1);
  }
  for (size_t i = 0; i < rule_list.size(); i++) {
    rule_list[i].priority = 100 - static_cast<int>(i);
  }

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
  return true;
}

std::string rule_engine::export_rules() const {
  return rules_to_json(rule_list);
}

bool rule_engine::import_rules(const std::string& text, std::string* err) {
  std::vector<rule> imported;
  if (!rules_from_json(text, imported, err)) return false;

  std::time_t t = now();
  for (auto& r : imported) {
    if (r.id.empty()) r.id = make_rule_id();
    if (r.created_at == 0) r.created_at = t;
    if (r.last_modified == 0) r.last_modified = t;
  }
  rule_list = std::move(imported);

  sort_rules();
  refresh_counts();
  save_rules();
  save_statistics();
  return true;
}

void rule_engine::sort_rules() {
  std::stable_sort(rule_list.begin(), rule_list.end(),
                   [](const rule& a, const rule& b) { return a.priority > b.priority; });
}

void rule_engine::refresh_counts() {
  stats.total_rules = static_cast<int>(rule_list.size());
  stats.enabled_rules = static_cast<int>(
    std::count_if(rule_list.begin(), rule_list.end(), [](const rule& r) { return r.enabled; }));
}

void rule_engine::save_rules() {
  if (!store) return;
  std::string err;
  try {
    if (!store->save(rules_key, rules_to_json(rule_list), err)) {
      std::cerr << "[storage] saving rules failed: " << err << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[storage] saving rules failed: " << e.what() << std::endl;
  }
}

void rule_engine::save_statistics() {
  if (!store) return;
  std::string err;
  try {
    if (!store->save(statistics_key, statistics_to_json(stats), err)) {
      std::cerr << "[storage] saving statistics failed: " << err << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[storage] saving statistics failed: " << e.what() << std::endl;
  }
}

rule* rule_engine::find_rule(const std::string& id) {
  for (auto& r : rule_list) {
    if (r.id == id) return &r;
  }
  return nullptr;
}
