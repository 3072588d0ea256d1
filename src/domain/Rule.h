#pragma once

#include "Message.h"

#include <ctime>
#include <string>
#include <variant>
#include <vector>

enum class match_mode {
  all,
  any
};

// Conditions. Each kind owns its operand.

struct sender_contains { std::string text; };
struct sender_is { std::string address; };
struct sender_domain { std::string domain; };
struct subject_contains { std::string text; };
struct body_contains { std::string text; };
struct category_is { mail_category category; };
struct priority_greater_than { int value; };
struct priority_less_than { int value; };
struct age_greater_than { int days; };
struct age_less_than { int days; };
struct has_attachment {};
struct is_unread {};
struct is_read {};
struct has_action_items {};
struct sender_is_vip {};

using condition = std::variant<sender_contains,
                               sender_is,
                               sender_domain,
                               subject_contains,
                               body_contains,
                               category_is,
                               priority_greater_than,
                               priority_less_than,
                               age_greater_than,
                               age_less_than,
                               has_attachment,
                               is_unread,
                               is_read,
                               has_action_items,
                               sender_is_vip>;

// Actions.

struct set_category { mail_category category; };
struct set_priority { int value; };
struct delete_message {};
struct archive_message {};
struct mark_read {};
struct mark_unread {};
struct move_to_mailbox { std::string mailbox; };
struct snooze_until { std::time_t until; };
struct add_tag { std::string tag; };
struct notify_user { std::string text; };
struct stop_processing {};

using action = std::variant<set_category,
                            set_priority,
                            delete_message,
                            archive_message,
                            mark_read,
                            mark_unread,
                            move_to_mailbox,
                            snooze_until,
                            add_tag,
                            notify_user,
                            stop_processing>;

struct rule {
  std::string id;
  std::string name;
  bool enabled = true;
  std::vector<condition> conditions;
  std::vector<action> actions;
  int priority = 50;
  match_mode match = match_mode::all;
  std::time_t created_at = 0;
  std::time_t last_modified = 0;
  int execution_count = 0;

  bool is_valid() const;
  std::string describe() const;
};

std::string condition_display_name(const condition& c);
std::string action_display_name(const action& a);
bool is_destructive(const action& a);

std::string make_rule_id();
