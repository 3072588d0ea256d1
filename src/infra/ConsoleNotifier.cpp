#include "Notifier.h"

#include <iostream>
#include <string>

class console_notifier : public notifier {
public:
  bool notify(const std::string& title, const std::string& body, std::string& err) override {
    std::cout << "[NOTIFY] " << title << ": " << body << std::endl;
    err.clear();
    return true;
  }
};

notifier* make_console_notifier() {
  return new console_notifier();
}
