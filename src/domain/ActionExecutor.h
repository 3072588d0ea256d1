#pragma once

#include "Message.h"
#include "Rule.h"
#include "SideEffect.h"

#include <optional>

struct action_outcome {
  bool stop = false;
  std::optional<side_effect> effect;
};

// Applies one action to the record in place. Only category, priority, read
// and snooze fields are written here; everything that has to reach the mail
// store or the notifier comes back as a side-effect request.
action_outcome apply_action(const action& a, message& msg);
