#pragma once

#include "../app/Config.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct api_reply {
  int status = 200;
  std::string body;
  std::string content_type = "application/json; charset=utf-8";
};

// Receives the raw request body.
using api_handler = std::function<api_reply(const std::string& body)>;

struct api_route {
  std::string method;  // "GET" or "POST"
  std::string path;
  api_handler handler;
};

api_reply json_reply(std::string body);
api_reply error_reply(int status, const std::string& message);

class http_server {
public:
  virtual ~http_server() = default;
  virtual bool start() = 0;
  virtual void stop() = 0;
};

// Fails on an unsupported method or a path registered twice.
std::unique_ptr<http_server> make_http_server(const http_config& cfg,
                                              std::vector<api_route> routes,
                                              std::string& err);
