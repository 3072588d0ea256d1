#include "Matcher.h"

#include "../util/Text.h"
#include "../util/Time.h"

namespace {

struct condition_check {
  const message& msg;
  const eval_context& ctx;

  long age_days() const { return time_util::calendar_days_between(msg.received, ctx.now); }

  bool operator()(const sender_contains& c) const {
    return text_util::contains_ci(msg.sender, c.text) ||
           text_util::contains_ci(msg.sender_email, c.text);
  }
  bool operator()(const sender_is& c) const {
    return text_util::equals_ci(msg.sender_email, c.address);
  }
  bool operator()(const sender_domain& c) const {
    if (c.domain.empty()) return false;
    return text_util::ends_with(text_util::to_lower(msg.sender_email),
                                "@" + text_util::to_lower(c.domain));
  }
  bool operator()(const subject_contains& c) const {
    return text_util::contains_ci(msg.subject, c.text);
  }
  bool operator()(const body_contains& c) const {
    if (!msg.body) return false;
    return text_util::contains_ci(*msg.body, c.text);
  }
  bool operator()(const category_is& c) const {
    return msg.category && *msg.category == c.category;
  }
  bool operator()(const priority_greater_than& c) const {
    return msg.priority && *msg.priority > c.value;
  }
  bool operator()(const priority_less_than& c) const {
    return msg.priority && *msg.priority < c.value;
  }
  bool operator()(const age_greater_than& c) const { return age_days() > c.days; }
  bool operator()(const age_less_than& c) const { return age_days() < c.days; }
  // No attachment index reaches this layer yet.
  bool operator()(const has_attachment&) const { return false; }
  bool operator()(const is_unread&) const { return !msg.read; }
  bool operator()(const is_read&) const { return msg.read; }
  bool operator()(const has_action_items&) const { return !msg.action_items.empty(); }
  // No VIP registry is wired in yet.
  bool operator()(const sender_is_vip&) const { return false; }
};

}  // namespace

bool evaluate_condition(const condition& cond, const message& msg, const eval_context& ctx) {
  return std::visit(condition_check{msg, ctx}, cond);
}

bool rule_matches(const rule& r, const message& msg, const eval_context& ctx) {
  if (!r.enabled) return false;
  if (r.conditions.empty()) return false;

  for (const auto& c : r.conditions) {
    bool matched = evaluate_condition(c, msg, ctx);
    if (r.match == match_mode::all && !matched) return false;
    if (r.match == match_mode::any && matched) return true;
  }

  return r.match == match_mode::all;
}
