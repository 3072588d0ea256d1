#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

enum class mail_category {
  bills,
  orders,
  work,
  personal,
  marketing,
  newsletters,
  social,
  spam,
  other
};

const char* category_name(mail_category c);
bool parse_category(const std::string& s, mail_category& out);

enum class action_item_kind {
  deadline,
  meeting,
  task,
  reminder
};

const char* action_item_kind_name(action_item_kind k);
bool parse_action_item_kind(const std::string& s, action_item_kind& out);

struct action_item {
  action_item_kind kind = action_item_kind::task;
  std::string text;
  std::optional<std::time_t> due;
};

struct message {
  std::string id;
  std::string ref;
  std::string sender;
  std::string sender_email;
  std::string subject;
  std::optional<std::string> body;
  std::time_t received = 0;
  bool read = false;
  std::optional<mail_category> category;
  std::optional<int> priority;
  bool snoozed = false;
  std::optional<std::time_t> snooze_until;
  std::vector<action_item> action_items;
  std::optional<double> sender_reputation;
  std::vector<std::string> tags;
};
