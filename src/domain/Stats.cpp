#include "Stats.h"

double run_statistics::success_rate() const {
  if (total_executions <= 0) return 0.0;
  return static_cast<double>(successful_executions) / static_cast<double>(total_executions);
}

void run_statistics::record(const execution_result& res) {
  total_executions++;
  if (res.is_success()) {
    successful_executions++;
  } else {
    failed_executions++;
  }
  duration_samples++;
  duration_total += res.duration_sec;
  avg_execution_time = duration_total / static_cast<double>(duration_samples);
}
