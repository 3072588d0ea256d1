#pragma once

#include <string>

// Key/value settings storage for the serialized rule set and statistics.
class kv_store {
public:
  virtual ~kv_store() = default;
  // Returns false when the key is absent (err left empty) or on failure.
  virtual bool load(const std::string& key, std::string& out, std::string& err) = 0;
  virtual bool save(const std::string& key, const std::string& value, std::string& err) = 0;
};

kv_store* make_sqlite_store(const std::string& path, std::string* err);
kv_store* make_memory_store();
