#include "HttpServer.h"

#include <httplib.h>

#include <atomic>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace {

const char* k_console_html = R"HTML(
<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8"/>
  <title>mailsift</title>
  <style>
    body { font-family: sans-serif; margin: 24px; max-width: 960px; }
    textarea { width: 100%; height: 260px; font-family: monospace; }
    pre { background: #f4f4f4; padding: 8px; overflow: auto; }
    section { margin-bottom: 20px; }
  </style>
</head>
<body>
  <h1>mailsift</h1>
  <section>
    <h3>Statistics</h3>
    <pre id="status">loading...</pre>
  </section>
  <section>
    <h3>Rules</h3>
    <textarea id="rules"></textarea>
    <button onclick="importRules()">Replace rule set</button>
    <span id="import-result"></span>
  </section>
  <section>
    <h3>Run a batch</h3>
    <textarea id="batch">{"messages": []}</textarea>
    <button onclick="runBatch()">Run</button>
    <pre id="report"></pre>
  </section>
  <script>
    async function refreshStatus() {
      const res = await fetch('/api/status').catch(() => null);
      document.getElementById('status').textContent = res && res.ok ? await res.text() : 'unavailable';
    }
    async function refreshRules() {
      const res = await fetch('/api/rules').catch(() => null);
      document.getElementById('rules').value = res && res.ok ? await res.text() : '';
    }
    async function importRules() {
      const res = await fetch('/api/rules', {method: 'POST', body: document.getElementById('rules').value});
      document.getElementById('import-result').textContent = res.ok ? 'imported' : await res.text();
      if (res.ok) refreshRules();
    }
    async function runBatch() {
      const res = await fetch('/api/run', {method: 'POST', body: document.getElementById('batch').value});
      document.getElementById('report').textContent = await res.text();
      refreshStatus();
      refreshRules();
    }
    refreshStatus();
    refreshRules();
    setInterval(refreshStatus, 5000);
  </script>
</body>
</html>
)HTML";

}  // namespace

api_reply json_reply(std::string body) {
  api_reply r;
  r.body = std::move(body);
  return r;
}

api_reply error_reply(int status, const std::string& message) {
  api_reply r;
  r.status = status;
  r.body = message.empty() ? "invalid request" : message;
  r.content_type = "text/plain; charset=utf-8";
  return r;
}

class http_server_impl final : public http_server {
public:
  http_server_impl(http_config cfg, std::vector<api_route> routes)
    : cfg(std::move(cfg)), routes(std::move(routes)) {}

  bool start() override {
    if (running) return true;

    server.Get("/", [](const httplib::Request&, httplib::Response& res) {
      res.set_content(k_console_html, "text/html; charset=utf-8");
    });

    for (const auto& route : routes) {
      const api_handler handler = route.handler;
      auto adapter = [handler](const httplib::Request& req, httplib::Response& res) {
        api_reply reply = handler(req.body);
        res.status = reply.status;
        res.set_content(reply.body, reply.content_type.c_str());
      };
      if (route.method == "GET") {
        server.Get(route.path, adapter);
      } else {
        server.Post(route.path, adapter);
      }
    }

    if (!server.bind_to_port(cfg.host.c_str(), cfg.port)) {
      std::cerr << "[http] cannot bind " << cfg.host << ":" << cfg.port << std::endl;
      return false;
    }

    running = true;
    worker = std::thread([this]() {
      server.listen_after_bind();
      running = false;
    });
    return true;
  }

  void stop() override {
    if (running) server.stop();
    if (worker.joinable()) worker.join();
    running = false;
  }

  ~http_server_impl() override { stop(); }

private:
  http_config cfg;
  std::vector<api_route> routes;
  httplib::Server server;
  std::thread worker;
  std::atomic<bool> running{false};
};

std::unique_ptr<http_server> make_http_server(const http_config& cfg,
                                              std::vector<api_route> routes,
                                              std::string& err) {
  std::set<std::string> seen;
  for (const auto& route : routes) {
    if (route.method != "GET" && route.method != "POST") {
      err = "unsupported method " + route.method + " for " + route.path;
      return nullptr;
    }
    if (!route.handler) {
      err = "no handler for " + route.method + " " + route.path;
      return nullptr;
    }
    if (!seen.insert(route.method + " " + route.path).second) {
      err = "route registered twice: " + route.method + " " + route.path;
      return nullptr;
    }
  }
  err.clear();
  return std::make_unique<http_server_impl>(cfg, std::move(routes));
}
