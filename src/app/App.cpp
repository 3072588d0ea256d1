#include "App.h"

#include "../domain/RuleJson.h"
#include "../util/Json.h"
#include "../util/Time.h"

#include <iostream>
#include <utility>
#include <vector>

static engine_options make_engine_options(const engine_config& cfg) {
  engine_options opts;
  opts.workers = cfg.workers;
  opts.seed_default_rules = cfg.seed_default_rules;
  return opts;
}

app::app(app_config cfg,
         std::unique_ptr<kv_store> store_ptr,
         std::unique_ptr<mail_mutator> mutator_ptr,
         std::unique_ptr<notifier> notifier_ptr)
  : cfg(std::move(cfg)),
    store_ptr(std::move(store_ptr)),
    mutator_ptr(std::move(mutator_ptr)),
    notifier_ptr(std::move(notifier_ptr)),
    engine(this->store_ptr.get(), this->mutator_ptr.get(), this->notifier_ptr.get(),
           make_engine_options(this->cfg.engine)) {
  engine.load();
  publish_statistics();
}

// Caller holds `mu`.
void app::publish_statistics() {
  std::string snapshot = statistics_to_json(engine.statistics());
  std::lock_guard<std::mutex> lock(status_mu);
  statistics_snapshot = std::move(snapshot);
}

bool app::run_batch(const std::string& messages_json, std::string& report_json, std::string& err) {
  std::vector<message> batch;
  if (!messages_from_json(messages_json, batch, &err)) {
    std::lock_guard<std::mutex> lock(status_mu);
    status.last_error = "batch: " + err;
    return false;
  }

  std::lock_guard<std::mutex> lock(mu);
  run_result res = engine.run(std::move(batch));
  publish_statistics();

  std::lock_guard<std::mutex> status_lock(status_mu);
  status.runs++;
  status.last_run = time_util::now_iso();
  status.messages_last = static_cast<int>(res.messages.size());
  status.side_effects_last = static_cast<int>(res.side_effects.size());
  for (const auto& r : res.results) {
    if (!r.errors.empty()) status.last_error = r.rule_name + ": " + r.errors.back();
  }

  report_json = run_result_to_json(res);
  return true;
}

bool app::test_rule(const std::string& request_json, std::string& result_json, std::string& err) {
  nlohmann::json req;
  if (!json_util::parse(request_json, req, &err)) return false;
  if (!req.is_object() || !req.contains("rule") || !req.contains("messages")) {
    err = "expected {\"rule\": ..., \"messages\": [...]}";
    return false;
  }

  rule candidate;
  if (!rule_from_json(req["rule"], candidate, err)) return false;
  std::vector<message> batch;
  if (!messages_from_json(req["messages"].dump(), batch, &err)) return false;

  rule_test_result res;
  {
    std::lock_guard<std::mutex> lock(mu);
    res = engine.test_rule(candidate, batch);
  }

  nlohmann::json out;
  out["matches"] = res.matches;
  out["total"] = res.total;
  result_json = out.dump(2);
  return true;
}

std::string app::status_json() const {
  std::lock_guard<std::mutex> lock(status_mu);
  nlohmann::json j;
  j["last_run"] = status.last_run;
  j["last_error"] = status.last_error;
  j["runs"] = status.runs;
  j["messages_last"] = status.messages_last;
  j["side_effects_last"] = status.side_effects_last;

  nlohmann::json stats;
  if (json_util::parse(statistics_snapshot, stats, nullptr)) {
    j["statistics"] = stats;
  }
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string app::rules_json() const {
  std::lock_guard<std::mutex> lock(mu);
  return engine.export_rules();
}

bool app::update_rules_json(const std::string& text, std::string& err) {
  std::lock_guard<std::mutex> lock(mu);
  if (!engine.import_rules(text, &err)) {
    std::cerr << "[rules] import rejected: " << err << std::endl;
    return false;
  }
  publish_statistics();
  for (const auto& r : engine.rules()) {
    if (!r.is_valid()) {
      std::cout << "[rules] '" << r.name << "' is incomplete (" << r.describe() << ")" << std::endl;
    }
  }
  std::cout << "[rules] imported " << engine.rules().size() << " rules" << std::endl;
  return true;
}

std::vector<api_route> api_routes(app& application) {
  std::vector<api_route> routes;

  routes.push_back({"GET", "/api/status", [&application](const std::string&) {
    return json_reply(application.status_json());
  }});

  routes.push_back({"GET", "/api/rules", [&application](const std::string&) {
    return json_reply(application.rules_json());
  }});

  routes.push_back({"POST", "/api/rules", [&application](const std::string& body) {
    std::string err;
    if (!application.update_rules_json(body, err)) return error_reply(400, err);
    return json_reply(application.rules_json());
  }});

  routes.push_back({"POST", "/api/rules/test", [&application](const std::string& body) {
    std::string out;
    std::string err;
    if (!application.test_rule(body, out, err)) return error_reply(400, err);
    return json_reply(out);
  }});

  routes.push_back({"POST", "/api/run", [&application](const std::string& body) {
    std::string out;
    std::string err;
    if (!application.run_batch(body, out, err)) return error_reply(400, err);
    return json_reply(out);
  }});

  return routes;
}
