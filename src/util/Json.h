#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace json_util {

inline bool read_file(const std::string& path, std::string& out, std::string* err) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    if (err) *err = "cannot read " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

inline bool parse(const std::string& text, nlohmann::json& out, std::string* err) {
  try {
    out = nlohmann::json::parse(text);
    return true;
  } catch (const nlohmann::json::exception& e) {
    if (err) *err = std::string("json error: ") + e.what();
    return false;
  }
}

// Parses a document that is either a bare array or an object holding the
// array under `key`, and leaves the array in `out`.
inline bool parse_collection(const std::string& text, const char* key, nlohmann::json& out,
                             std::string* err) {
  nlohmann::json root;
  if (!parse(text, root, err)) return false;
  if (root.is_object() && root.contains(key)) {
    out = root[key];
  } else if (root.is_array()) {
    out = std::move(root);
  } else {
    if (err) *err = std::string(key) + ": root must be an array or an object with \"" + key + "\"";
    return false;
  }
  if (!out.is_array()) {
    if (err) *err = std::string(key) + ": expected an array";
    return false;
  }
  return true;
}

// Object stored under `key`, or an empty object when it is absent or not an object.
inline nlohmann::json section(const nlohmann::json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end() || !it->is_object()) return nlohmann::json::object();
  return *it;
}

}
