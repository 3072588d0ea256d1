#pragma once

#include <string>

enum class side_effect_kind {
  remove,
  archive,
  mark_read,
  mark_unread,
  move,
  add_tag,
  notify
};

const char* side_effect_kind_name(side_effect_kind k);

// A request for a collaborator (mail-store mutator or notifier). The engine
// emits these; it never performs them against the mail store itself.
struct side_effect {
  side_effect_kind kind = side_effect_kind::notify;
  std::string rule_id;
  std::string message_id;
  std::string ref;
  std::string argument;
  std::string title;
};
