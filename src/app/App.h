#pragma once

#include "Config.h"

#include "../domain/RuleEngine.h"
#include "../infra/HttpServer.h"
#include "../infra/MailMutator.h"
#include "../infra/Notifier.h"
#include "../infra/Storage.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct app_status {
  std::string last_run;
  std::string last_error;
  int runs = 0;
  int messages_last = 0;
  int side_effects_last = 0;
};

class app {
public:
  app(app_config cfg,
      std::unique_ptr<kv_store> store_ptr,
      std::unique_ptr<mail_mutator> mutator_ptr,
      std::unique_ptr<notifier> notifier_ptr);

  bool run_batch(const std::string& messages_json, std::string& report_json, std::string& err);
  bool test_rule(const std::string& request_json, std::string& result_json, std::string& err);

  std::string status_json() const;
  std::string rules_json() const;
  bool update_rules_json(const std::string& text, std::string& err);

private:
  app_config cfg;
  std::unique_ptr<kv_store> store_ptr;
  std::unique_ptr<mail_mutator> mutator_ptr;
  std::unique_ptr<notifier> notifier_ptr;
  rule_engine engine;

  void publish_statistics();

  // `mu` serialises engine access; `status_mu` only guards the status snapshot,
  // so status reads never wait for a run in progress.
  mutable std::mutex mu;
  mutable std::mutex status_mu;
  app_status status;
  std::string statistics_snapshot;
};

// GET /api/status, GET /api/rules, POST /api/rules, POST /api/rules/test, POST /api/run.
std::vector<api_route> api_routes(app& application);
