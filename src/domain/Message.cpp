#include "Message.h"

#include "../util/Text.h"

namespace {

const mail_category k_categories[] = {
  mail_category::bills,     mail_category::orders,      mail_category::work,
  mail_category::personal,  mail_category::marketing,   mail_category::newsletters,
  mail_category::social,    mail_category::spam,        mail_category::other,
};

const action_item_kind k_item_kinds[] = {
  action_item_kind::deadline,
  action_item_kind::meeting,
  action_item_kind::task,
  action_item_kind::reminder,
};

}  // namespace

const char* category_name(mail_category c) {
  switch (c) {
    case mail_category::bills: return "Bills";
    case mail_category::orders: return "Orders";
    case mail_category::work: return "Work";
    case mail_category::personal: return "Personal";
    case mail_category::marketing: return "Marketing";
    case mail_category::newsletters: return "Newsletters";
    case mail_category::social: return "Social";
    case mail_category::spam: return "Spam";
    case mail_category::other: return "Other";
  }
  return "Other";
}

bool parse_category(const std::string& s, mail_category& out) {
  for (auto c : k_categories) {
    if (text_util::equals_ci(s, category_name(c))) {
      out = c;
      return true;
    }
  }
  return false;
}

const char* action_item_kind_name(action_item_kind k) {
  switch (k) {
    case action_item_kind::deadline: return "deadline";
    case action_item_kind::meeting: return "meeting";
    case action_item_kind::task: return "task";
    case action_item_kind::reminder: return "reminder";
  }
  return "task";
}

bool parse_action_item_kind(const std::string& s, action_item_kind& out) {
  for (auto k : k_item_kinds) {
    if (text_util::equals_ci(s, action_item_kind_name(k))) {
      out = k;
      return true;
    }
  }
  return false;
}
