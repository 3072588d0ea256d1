#pragma once

#include "Message.h"
#include "Rule.h"

#include <ctime>

struct eval_context {
  std::time_t now = 0;
};

bool evaluate_condition(const condition& cond, const message& msg, const eval_context& ctx);

// False for a disabled rule or one without conditions, whatever the mode.
bool rule_matches(const rule& r, const message& msg, const eval_context& ctx);
