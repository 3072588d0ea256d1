#include "ActionExecutor.h"

#include <algorithm>
#include <string>
#include <utility>

namespace {

side_effect request_for(side_effect_kind kind, const message& msg, std::string argument = "") {
  side_effect fx;
  fx.kind = kind;
  fx.message_id = msg.id;
  fx.ref = msg.ref;
  fx.argument = std::move(argument);
  return fx;
}

struct action_apply {
  message& msg;

  action_outcome operator()(const set_category& a) const {
    msg.category = a.category;
    return {};
  }
  action_outcome operator()(const set_priority& a) const {
    msg.priority = std::min(std::max(a.value, 1), 10);
    return {};
  }
  action_outcome operator()(const delete_message&) const {
    return {false, request_for(side_effect_kind::remove, msg)};
  }
  action_outcome operator()(const archive_message&) const {
    return {false, request_for(side_effect_kind::archive, msg)};
  }
  action_outcome operator()(const mark_read&) const {
    msg.read = true;
    return {false, request_for(side_effect_kind::mark_read, msg)};
  }
  action_outcome operator()(const mark_unread&) const {
    msg.read = false;
    return {false, request_for(side_effect_kind::mark_unread, msg)};
  }
  action_outcome operator()(const move_to_mailbox& a) const {
    return {false, request_for(side_effect_kind::move, msg, a.mailbox)};
  }
  action_outcome operator()(const snooze_until& a) const {
    msg.snoozed = true;
    msg.snooze_until = a.until;
    return {};
  }
  action_outcome operator()(const add_tag& a) const {
    return {false, request_for(side_effect_kind::add_tag, msg, a.tag)};
  }
  action_outcome operator()(const notify_user& a) const {
    side_effect fx = request_for(side_effect_kind::notify, msg, a.text);
    fx.title = "Rule: " + msg.subject;
    return {false, fx};
  }
  action_outcome operator()(const stop_processing&) const {
    return {true, std::nullopt};
  }
};

}  // namespace

const char* side_effect_kind_name(side_effect_kind k) {
  switch (k) {
    case side_effect_kind::remove: return "delete";
    case side_effect_kind::archive: return "archive";
    case side_effect_kind::mark_read: return "markRead";
    case side_effect_kind::mark_unread: return "markUnread";
    case side_effect_kind::move: return "move";
    case side_effect_kind::add_tag: return "addTag";
    case side_effect_kind::notify: return "notify";
  }
  return "notify";
}

action_outcome apply_action(const action& a, message& msg) {
  return std::visit(action_apply{msg}, a);
}
