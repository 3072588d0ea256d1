#include "MailMutator.h"
#include "Storage.h"

#include "../util/Time.h"

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace {

const char* k_ddl_settings =
  "CREATE TABLE IF NOT EXISTS settings ("
  " key TEXT PRIMARY KEY,"
  " value TEXT NOT NULL,"
  " updated_iso TEXT"
  ");";

const char* k_ddl_pending_actions =
  "CREATE TABLE IF NOT EXISTS pending_actions ("
  " id INTEGER PRIMARY KEY AUTOINCREMENT,"
  " kind TEXT NOT NULL,"
  " rule_id TEXT,"
  " message_id TEXT,"
  " ref TEXT,"
  " argument TEXT,"
  " ts_iso TEXT"
  ");";

// Opens the database and runs `ddl`; on failure `db` is left null.
sqlite3* open_db(const std::string& path, const char* ddl, std::string& err) {
  sqlite3* db = nullptr;
  if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
    err = "sqlite open failed: " + std::string(sqlite3_errmsg(db));
    sqlite3_close(db);
    return nullptr;
  }

  char* err_msg = nullptr;
  if (sqlite3_exec(db, ddl, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    err = "sqlite ddl failed: " + std::string(err_msg ? err_msg : "");
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return nullptr;
  }
  return db;
}

}  // namespace

class sqlite_store final : public kv_store {
public:
  explicit sqlite_store(const std::string& path, std::string& err) {
    db = open_db(path, k_ddl_settings, err);
  }

  ~sqlite_store() override {
    if (db) sqlite3_close(db);
  }

  bool load(const std::string& key, std::string& out, std::string& err) override {
    std::lock_guard<std::mutex> lock(mu);
    err.clear();
    if (!db) {
      err = "sqlite not open";
      return false;
    }
    const char* sql = "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      err = sqlite3_errmsg(db);
      return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    bool found = false;
    if (rc == SQLITE_ROW) {
      const unsigned char* text = sqlite3_column_text(stmt, 0);
      out = text ? reinterpret_cast<const char*>(text) : "";
      found = true;
    } else if (rc != SQLITE_DONE) {
      err = sqlite3_errmsg(db);
    }
    sqlite3_finalize(stmt);
    return found;
  }

  bool save(const std::string& key, const std::string& value, std::string& err) override {
    std::lock_guard<std::mutex> lock(mu);
    if (!db) {
      err = "sqlite not open";
      return false;
    }
    const char* sql =
      "INSERT OR REPLACE INTO settings (key, value, updated_iso) VALUES (?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      err = sqlite3_errmsg(db);
      return false;
    }
    std::string ts = time_util::now_iso();
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, ts.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      err = sqlite3_errmsg(db);
      return false;
    }
    return true;
  }

private:
  sqlite3* db = nullptr;
  std::mutex mu;
};

class sqlite_queue final : public action_queue {
public:
  explicit sqlite_queue(const std::string& path, std::string& err) {
    db = open_db(path, k_ddl_pending_actions, err);
  }

  ~sqlite_queue() override {
    if (db) sqlite3_close(db);
  }

  bool apply(const side_effect& req, std::string& err) override {
    std::lock_guard<std::mutex> lock(mu);
    if (!db) {
      err = "sqlite not open";
      return false;
    }
    if (req.ref.empty()) {
      err = "missing message reference";
      return false;
    }
    const char* sql =
      "INSERT INTO pending_actions (kind, rule_id, message_id, ref, argument, ts_iso)"
      " VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      err = sqlite3_errmsg(db);
      return false;
    }
    std::string ts = time_util::now_iso();
    sqlite3_bind_text(stmt, 1, side_effect_kind_name(req.kind), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, req.rule_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, req.message_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, req.ref.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, req.argument.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, ts.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      err = sqlite3_errmsg(db);
      return false;
    }
    return true;
  }

  int pending_count() const override {
    std::lock_guard<std::mutex> lock(mu);
    if (!db) return 0;
    const char* sql = "SELECT COUNT(*) FROM pending_actions;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;
    int rc = sqlite3_step(stmt);
    int count = (rc == SQLITE_ROW) ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return count;
  }

private:
  sqlite3* db = nullptr;
  mutable std::mutex mu;
};

kv_store* make_sqlite_store(const std::string& path, std::string* err) {
  std::string e;
  auto* ptr = new sqlite_store(path, e);
  if (!e.empty()) {
    if (err) *err = e;
    delete ptr;
    return nullptr;
  }
  return ptr;
}

action_queue* make_sqlite_queue(const std::string& path, std::string* err) {
  std::string e;
  auto* ptr = new sqlite_queue(path, e);
  if (!e.empty()) {
    if (err) *err = e;
    delete ptr;
    return nullptr;
  }
  return ptr;
}
