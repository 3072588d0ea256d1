#include "Notifier.h"

#include "../util/Json.h"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

// Bot API limit for a single sendMessage text.
const size_t k_max_text = 4096;

struct curl_global_guard {
  curl_global_guard() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~curl_global_guard() { curl_global_cleanup(); }
};

curl_global_guard curl_guard;

struct curl_easy_deleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

using curl_handle = std::unique_ptr<CURL, curl_easy_deleter>;

using form_fields = std::vector<std::pair<std::string, std::string>>;

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string escape(CURL* curl, const std::string& s) {
  char* enc = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
  if (!enc) return s;
  std::string out(enc);
  curl_free(enc);
  return out;
}

// Cuts on a UTF-8 character boundary so the API does not reject the text.
std::string clip_text(const std::string& text) {
  if (text.size() <= k_max_text) return text;
  size_t cut = k_max_text - 3;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut--;
  return text.substr(0, cut) + "...";
}

struct http_reply {
  long code = 0;
  std::string body;
};

bool post_form(const std::string& url, const form_fields& fields, long timeout_sec,
               http_reply& reply, std::string& err) {
  curl_handle curl(curl_easy_init());
  if (!curl) {
    err = "curl init failed";
    return false;
  }

  std::string form;
  for (const auto& f : fields) {
    if (!form.empty()) form += "&";
    form += f.first + "=" + escape(curl.get(), f.second);
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_sec < 10L ? timeout_sec : 10L);

  CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    err = curl_easy_strerror(rc);
    return false;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &reply.code);
  return true;
}

}  // namespace

class telegram_notifier final : public notifier {
public:
  explicit telegram_notifier(telegram_config cfg) : cfg(std::move(cfg)) {}

  bool notify(const std::string& title, const std::string& body, std::string& err) override {
    const std::string url = cfg.api_url + "/bot" + cfg.bot_token + "/sendMessage";
    const std::string text = clip_text(title.empty() ? body : title + "\n" + body);

    http_reply reply;
    if (!post_form(url, {{"chat_id", cfg.chat_id}, {"text", text}}, cfg.timeout_sec, reply, err)) {
      err = "telegram: " + err;
      return false;
    }

    // Rejections come back as {"ok": false, "description": ...}, usually with a 4xx code.
    nlohmann::json answer;
    const bool parsed = json_util::parse(reply.body, answer, nullptr) && answer.is_object();
    if (parsed && !answer.value("ok", true)) {
      err = "telegram: " + answer.value("description", std::string("request rejected"));
      return false;
    }
    if (reply.code < 200 || reply.code >= 300) {
      err = "telegram: http " + std::to_string(reply.code);
      return false;
    }

    err.clear();
    return true;
  }

private:
  telegram_config cfg;
};

notifier* make_telegram_notifier(const telegram_config& cfg, std::string* err) {
  if (cfg.bot_token.empty() || cfg.chat_id.empty()) {
    if (err) *err = "telegram config incomplete";
    return nullptr;
  }
  if (cfg.api_url.empty()) {
    if (err) *err = "telegram.api_url is empty";
    return nullptr;
  }
  return new telegram_notifier(cfg);
}
