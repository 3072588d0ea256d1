#include "MailMutator.h"

#include <iostream>
#include <string>

class console_mutator : public mail_mutator {
public:
  bool apply(const side_effect& req, std::string& err) override {
    std::cout << "[MUTATE] " << side_effect_kind_name(req.kind) << " ref=" << req.ref;
    if (!req.argument.empty()) std::cout << " arg=" << req.argument;
    std::cout << std::endl;
    err.clear();
    return true;
  }
};

mail_mutator* make_console_mutator() {
  return new console_mutator();
}
