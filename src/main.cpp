#include "app/App.h"
#include "app/Config.h"
#include "domain/RuleJson.h"
#include "infra/MailMutator.h"
#include "infra/Notifier.h"
#include "infra/Storage.h"
#include "util/Json.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
  g_stop = true;
}

const std::time_t k_day = 24 * 60 * 60;

std::vector<message> demo_messages(std::time_t now) {
  std::vector<message> res;

  message a;
  a.id = "m1";
  a.ref = "<m1@demo>";
  a.sender = "Deals Team";
  a.sender_email = "deals@shop.example.com";
  a.subject = "Last chance: 40% off";
  a.body = std::string("Our biggest sale of the season ends tonight.");
  a.received = now - 10 * k_day;
  a.category = mail_category::marketing;
  res.push_back(a);

  message b;
  b.id = "m2";
  b.ref = "<m2@demo>";
  b.sender = "City Power";
  b.sender_email = "billing@citypower.example.org";
  b.subject = "Your March statement is ready";
  b.body = std::string("Amount due: 84.10. Please pay by the 28th.");
  b.received = now - k_day;
  b.category = mail_category::bills;
  b.priority = 5;
  res.push_back(b);

  message c;
  c.id = "m3";
  c.ref = "<m3@demo>";
  c.sender = "Weekly Digest";
  c.sender_email = "digest@news.example.net";
  c.subject = "Weekly digest";
  c.body = std::string("Lots of random updates...");
  c.received = now - 5 * k_day;
  c.category = mail_category::newsletters;
  res.push_back(c);

  return res;
}

void ensure_parent_dir(const std::string& path) {
  std::error_code ec;
  std::filesystem::path p(path);
  auto parent = p.parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
}

void print_rule(const rule& r) {
  std::cout << "[" << r.priority << "] " << r.name << " (" << r.describe() << ")" << std::endl;
  for (const auto& c : r.conditions) std::cout << "    if   " << condition_display_name(c) << std::endl;
  for (const auto& a : r.actions) {
    std::cout << "    then " << action_display_name(a);
    if (is_destructive(a)) std::cout << " [destructive]";
    std::cout << std::endl;
  }
}

int run_demo() {
  app_config cfg;
  std::unique_ptr<kv_store> store(make_memory_store());
  std::unique_ptr<mail_mutator> mutator(make_console_mutator());
  std::unique_ptr<notifier> notify(make_console_notifier());
  std::string err;

  app application(cfg, std::move(store), std::move(mutator), std::move(notify));

  std::vector<rule> rules;
  if (rules_from_json(application.rules_json(), rules, &err)) {
    for (const auto& r : rules) print_rule(r);
  } else {
    std::cerr << "demo error: " << err << std::endl;
  }

  nlohmann::json batch = nlohmann::json::array();
  for (const auto& m : demo_messages(std::time(nullptr))) batch.push_back(message_to_json(m));

  std::string report;
  if (!application.run_batch(batch.dump(), report, err)) {
    std::cerr << "demo error: " << err << std::endl;
    return 1;
  }
  std::cout << report << std::endl;
  std::cout << application.status_json() << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/mailsift.json";
  std::string batch_path;
  bool demo = false;
  bool serve = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--batch" && i + 1 < argc) {
      batch_path = argv[++i];
    } else if (arg == "--demo") {
      demo = true;
    } else if (arg == "--serve") {
      serve = true;
    } else if (arg == "--help") {
      std::cout << "Usage: mailsift --config <path> [--batch <messages.json>] [--serve]\n"
                   "       mailsift --demo" << std::endl;
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << std::endl;
      return 2;
    }
  }

  if (demo) return run_demo();

  app_config cfg;
  std::string err;
  if (!load_app_config(config_path, cfg, err)) {
    std::cerr << "config error: " << err << std::endl;
    return 1;
  }

  ensure_parent_dir(cfg.storage.path);

  std::unique_ptr<kv_store> store(make_sqlite_store(cfg.storage.path, &err));
  if (!store) {
    std::cerr << "storage error: " << err << std::endl;
    return 1;
  }

  std::unique_ptr<mail_mutator> mutator;
  if (cfg.mutator == "console") {
    mutator.reset(make_console_mutator());
  } else {
    mutator.reset(make_sqlite_queue(cfg.storage.path, &err));
    if (!mutator) {
      std::cerr << "queue error: " << err << std::endl;
      return 1;
    }
  }

  std::unique_ptr<notifier> notify;
  if (cfg.telegram.enabled) {
    notify.reset(make_telegram_notifier(cfg.telegram, &err));
    if (!notify) {
      std::cerr << "telegram error: " << err << std::endl;
      return 1;
    }
  } else {
    notify.reset(make_console_notifier());
  }

  app application(cfg, std::move(store), std::move(mutator), std::move(notify));

  if (!batch_path.empty()) {
    std::string text;
    if (!json_util::read_file(batch_path, text, &err)) {
      std::cerr << "batch error: " << err << std::endl;
      return 1;
    }
    std::string report;
    if (!application.run_batch(text, report, err)) {
      std::cerr << "batch error: " << err << std::endl;
      return 1;
    }
    std::cout << report << std::endl;
  }

  if (!serve && !(batch_path.empty() && cfg.http.enabled)) return 0;

  auto server = make_http_server(cfg.http, api_routes(application), err);
  if (!server || !server->start()) {
    std::cerr << "http server failed: " << err << std::endl;
    return 1;
  }
  std::cout << "[http] listening on " << cfg.http.host << ":" << cfg.http.port << std::endl;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  server->stop();
  return 0;
}
