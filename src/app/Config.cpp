#include "Config.h"

#include "../util/Json.h"
#include "../util/Text.h"

#include <cstdlib>
#include <string>

using nlohmann::json;

std::string expand_env(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '$' && i + 1 < input.size() && input[i + 1] == '{') {
      size_t end = input.find('}', i + 2);
      if (end == std::string::npos) {
        out.push_back(input[i]);
        continue;
      }
      std::string key = input.substr(i + 2, end - (i + 2));
      const char* val = std::getenv(key.c_str());
      if (val) out.append(val);
      i = end;
      continue;
    }
    out.push_back(input[i]);
  }
  return out;
}

static std::string get_string(const json& obj, const char* key, const std::string& def = "") {
  if (!obj.contains(key)) return def;
  if (!obj[key].is_string()) return def;
  return expand_env(obj[key].get<std::string>());
}

static int get_int(const json& obj, const char* key, int def) {
  if (!obj.contains(key)) return def;
  if (obj[key].is_number_integer()) return obj[key].get<int>();
  if (obj[key].is_string()) {
    try {
      return std::stoi(expand_env(obj[key].get<std::string>()));
    } catch (const std::exception&) {
      return def;
    }
  }
  return def;
}

static bool get_bool(const json& obj, const char* key, bool def) {
  if (!obj.contains(key)) return def;
  if (obj[key].is_boolean()) return obj[key].get<bool>();
  if (obj[key].is_number_integer()) return obj[key].get<int>() != 0;
  if (obj[key].is_string()) {
    std::string v = text_util::to_lower(expand_env(obj[key].get<std::string>()));
    return v == "1" || v == "true" || v == "yes";
  }
  return def;
}

bool parse_app_config(const std::string& text, app_config& out, std::string& err) {
  json root;
  if (!json_util::parse(text, root, &err)) return false;

  if (!root.is_object()) {
    err = "config root must be an object";
    return false;
  }

  const json storage = json_util::section(root, "storage");
  out.storage.path = get_string(storage, "path", out.storage.path);

  const json engine = json_util::section(root, "engine");
  out.engine.workers = get_int(engine, "workers", out.engine.workers);
  out.engine.seed_default_rules = get_bool(engine, "seed_default_rules", out.engine.seed_default_rules);

  const json telegram = json_util::section(root, "telegram");
  out.telegram.enabled = get_bool(telegram, "enabled", out.telegram.enabled);
  out.telegram.bot_token = get_string(telegram, "bot_token");
  out.telegram.chat_id = get_string(telegram, "chat_id");
  out.telegram.api_url = get_string(telegram, "api_url", out.telegram.api_url);
  while (text_util::ends_with(out.telegram.api_url, "/")) out.telegram.api_url.pop_back();
  out.telegram.timeout_sec = get_int(telegram, "timeout_sec", static_cast<int>(out.telegram.timeout_sec));

  const json http = json_util::section(root, "http");
  out.http.enabled = get_bool(http, "enabled", out.http.enabled);
  out.http.host = get_string(http, "host", out.http.host);
  out.http.port = get_int(http, "port", out.http.port);

  out.mutator = text_util::to_lower(text_util::trim(get_string(root, "mutator", out.mutator)));

  if (out.storage.path.empty()) {
    err = "storage.path is required";
    return false;
  }
  if (out.engine.workers < 1 || out.engine.workers > 64) {
    err = "engine.workers must be between 1 and 64";
    return false;
  }
  if (out.mutator != "queue" && out.mutator != "console") {
    err = "mutator must be \"queue\" or \"console\"";
    return false;
  }
  if (out.telegram.enabled && (out.telegram.bot_token.empty() || out.telegram.chat_id.empty())) {
    err = "telegram.bot_token and telegram.chat_id are required (can use ${ENV})";
    return false;
  }
  if (out.telegram.timeout_sec < 1 || out.telegram.timeout_sec > 120) {
    err = "telegram.timeout_sec must be between 1 and 120";
    return false;
  }
  if (out.http.port <= 0 || out.http.port > 65535) {
    err = "http.port out of range";
    return false;
  }

  return true;
}

bool load_app_config(const std::string& path, app_config& out, std::string& err) {
  std::string text;
  if (!json_util::read_file(path, text, &err)) return false;
  return parse_app_config(text, out, err);
}
