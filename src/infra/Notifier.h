#pragma once

#include "../app/Config.h"

#include <string>

class notifier {
public:
  virtual ~notifier() = default;
  virtual bool notify(const std::string& title, const std::string& body, std::string& err) = 0;
};

notifier* make_telegram_notifier(const telegram_config& cfg, std::string* err);
notifier* make_console_notifier();
