#pragma once

#include "../domain/SideEffect.h"

#include <string>

class mail_mutator {
public:
  virtual ~mail_mutator() = default;
  virtual bool apply(const side_effect& req, std::string& err) = 0;
};

// Persistent queue of requests, drained by an external mail-store driver.
class action_queue : public mail_mutator {
public:
  virtual int pending_count() const = 0;
};

action_queue* make_sqlite_queue(const std::string& path, std::string* err);
mail_mutator* make_console_mutator();
