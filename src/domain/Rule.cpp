#include "Rule.h"

#include "../util/Time.h"

#include <cstdio>
#include <random>
#include <string>

namespace {

std::string quoted(const std::string& s) {
  return "'" + s + "'";
}

std::string days_label(int days) {
  return std::to_string(days) + (days == 1 ? " day" : " days");
}

std::string count_label(size_t n, const char* noun) {
  return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

struct condition_name_visitor {
  std::string operator()(const sender_contains& c) const { return "Sender contains " + quoted(c.text); }
  std::string operator()(const sender_is& c) const { return "Sender is " + quoted(c.address); }
  std::string operator()(const sender_domain& c) const { return "Sender domain is " + quoted(c.domain); }
  std::string operator()(const subject_contains& c) const { return "Subject contains " + quoted(c.text); }
  std::string operator()(const body_contains& c) const { return "Body contains " + quoted(c.text); }
  std::string operator()(const category_is& c) const {
    return std::string("Category is ") + category_name(c.category);
  }
  std::string operator()(const priority_greater_than& c) const { return "Priority > " + std::to_string(c.value); }
  std::string operator()(const priority_less_than& c) const { return "Priority < " + std::to_string(c.value); }
  std::string operator()(const age_greater_than& c) const { return "Older than " + days_label(c.days); }
  std::string operator()(const age_less_than& c) const { return "Newer than " + days_label(c.days); }
  std::string operator()(const has_attachment&) const { return "Has attachment"; }
  std::string operator()(const is_unread&) const { return "Is unread"; }
  std::string operator()(const is_read&) const { return "Is read"; }
  std::string operator()(const has_action_items&) const { return "Has action items"; }
  std::string operator()(const sender_is_vip&) const { return "Sender is VIP"; }
};

struct action_name_visitor {
  std::string operator()(const set_category& a) const {
    return std::string("Categorize as ") + category_name(a.category);
  }
  std::string operator()(const set_priority& a) const { return "Set priority to " + std::to_string(a.value); }
  std::string operator()(const delete_message&) const { return "Delete"; }
  std::string operator()(const archive_message&) const { return "Archive"; }
  std::string operator()(const mark_read&) const { return "Mark as read"; }
  std::string operator()(const mark_unread&) const { return "Mark as unread"; }
  std::string operator()(const move_to_mailbox& a) const { return "Move to " + quoted(a.mailbox); }
  std::string operator()(const snooze_until& a) const { return "Snooze until " + time_util::format_iso(a.until); }
  std::string operator()(const add_tag& a) const { return "Add tag " + quoted(a.tag); }
  std::string operator()(const notify_user& a) const { return "Notify: " + a.text; }
  std::string operator()(const stop_processing&) const { return "Stop processing rules"; }
};

}  // namespace

bool rule::is_valid() const {
  return !name.empty() && !conditions.empty() && !actions.empty();
}

std::string rule::describe() const {
  return count_label(conditions.size(), "condition") + ", " + count_label(actions.size(), "action");
}

std::string condition_display_name(const condition& c) {
  return std::visit(condition_name_visitor{}, c);
}

std::string action_display_name(const action& a) {
  return std::visit(action_name_visitor{}, a);
}

bool is_destructive(const action& a) {
  return std::holds_alternative<delete_message>(a);
}

std::string make_rule_id() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<unsigned> byte(0, 255);
  unsigned char b[16];
  for (auto& x : b) x = static_cast<unsigned char>(byte(gen));
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
  char buf[37]{};
  std::snprintf(buf, sizeof(buf),
                "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
  return buf;
}
