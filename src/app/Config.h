#pragma once

#include <string>

struct telegram_config {
  bool enabled = false;
  std::string bot_token;
  std::string chat_id;
  std::string api_url = "https://api.telegram.org";
  long timeout_sec = 20;
};

struct http_config {
  bool enabled = false;
  std::string host = "127.0.0.1";
  int port = 8080;
};

struct storage_config {
  std::string path = "data/mailsift.db";
};

struct engine_config {
  int workers = 1;
  bool seed_default_rules = true;
};

struct app_config {
  storage_config storage;
  engine_config engine;
  telegram_config telegram;
  http_config http;
  // "queue" writes requests to storage for a mail-store driver; "console" prints them.
  std::string mutator = "queue";
};

bool load_app_config(const std::string& path, app_config& out, std::string& err);
bool parse_app_config(const std::string& text, app_config& out, std::string& err);

std::string expand_env(const std::string& input);
