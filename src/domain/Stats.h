#pragma once

#include "Message.h"
#include "SideEffect.h"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

struct execution_result {
  std::string rule_id;
  std::string rule_name;
  bool matched = false;
  int actions_executed = 0;
  std::vector<std::string> errors;
  double duration_sec = 0.0;

  bool is_success() const { return errors.empty(); }
};

struct run_statistics {
  int total_rules = 0;
  int enabled_rules = 0;
  int total_executions = 0;
  int successful_executions = 0;
  int failed_executions = 0;
  std::optional<std::time_t> last_execution;
  double avg_execution_time = 0.0;
  long duration_samples = 0;
  double duration_total = 0.0;

  double success_rate() const;
  void record(const execution_result& res);
};

struct run_result {
  std::vector<message> messages;
  std::vector<execution_result> results;
  std::vector<side_effect> side_effects;
};
