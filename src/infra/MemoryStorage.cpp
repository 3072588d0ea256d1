#include "Storage.h"

#include <map>
#include <mutex>
#include <string>

class memory_store final : public kv_store {
public:
  bool load(const std::string& key, std::string& out, std::string& err) override {
    std::lock_guard<std::mutex> lock(mu);
    err.clear();
    auto it = values.find(key);
    if (it == values.end()) return false;
    out = it->second;
    return true;
  }

  bool save(const std::string& key, const std::string& value, std::string& err) override {
    std::lock_guard<std::mutex> lock(mu);
    err.clear();
    values[key] = value;
    return true;
  }

private:
  std::mutex mu;
  std::map<std::string, std::string> values;
};

kv_store* make_memory_store() {
  return new memory_store();
}
