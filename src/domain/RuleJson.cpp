#include "RuleJson.h"

#include "../util/Json.h"
#include "../util/Text.h"
#include "../util/Time.h"

#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace {

json time_to_json(std::time_t t) {
  return time_util::format_iso(t);
}

// Years 0001..9999, the span gmtime/localtime and the ISO form can represent.
const long long k_min_timestamp = -62135596800LL;
const long long k_max_timestamp = 253402300799LL;

// Text with invalid UTF-8 can only come in through the C++ API; it is written
// out with U+FFFD instead of failing the whole document.
std::string dump_text(const json& j, int indent) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::time_t time_from_json(const json& j) {
  if (j.is_number_unsigned()) {
    if (j.get<unsigned long long>() > static_cast<unsigned long long>(k_max_timestamp)) {
      throw std::runtime_error("bad timestamp: " + j.dump());
    }
    return static_cast<std::time_t>(j.get<unsigned long long>());
  }
  if (j.is_number_integer()) {
    const long long v = j.get<long long>();
    if (v < k_min_timestamp || v > k_max_timestamp) {
      throw std::runtime_error("bad timestamp: " + j.dump());
    }
    return static_cast<std::time_t>(v);
  }
  std::time_t t = 0;
  if (!j.is_string() || !time_util::parse_iso(j.get<std::string>(), t)) {
    throw std::runtime_error("bad timestamp: " + j.dump());
  }
  return t;
}

mail_category category_from_json(const json& j) {
  mail_category c = mail_category::other;
  if (!j.is_string() || !parse_category(j.get<std::string>(), c)) {
    throw std::runtime_error("unknown category: " + j.dump());
  }
  return c;
}

json tagged(const char* type) {
  json j;
  j["type"] = type;
  return j;
}

// Conditions and actions may arrive wrapped as {"id": ..., "type": {...}}.
const json& tagged_payload(const json& j) {
  if (j.is_object() && j.contains("type") && j["type"].is_object()) return j["type"];
  return j;
}

struct condition_encoder {
  json operator()(const sender_contains& c) const { return {{"type", "senderContains"}, {"value", c.text}}; }
  json operator()(const sender_is& c) const { return {{"type", "senderIs"}, {"value", c.address}}; }
  json operator()(const sender_domain& c) const { return {{"type", "senderDomain"}, {"value", c.domain}}; }
  json operator()(const subject_contains& c) const { return {{"type", "subjectContains"}, {"value", c.text}}; }
  json operator()(const body_contains& c) const { return {{"type", "bodyContains"}, {"value", c.text}}; }
  json operator()(const category_is& c) const {
    return {{"type", "categoryIs"}, {"category", category_name(c.category)}};
  }
  json operator()(const priority_greater_than& c) const {
    return {{"type", "priorityGreaterThan"}, {"value", c.value}};
  }
  json operator()(const priority_less_than& c) const {
    return {{"type", "priorityLessThan"}, {"value", c.value}};
  }
  json operator()(const age_greater_than& c) const { return {{"type", "ageGreaterThan"}, {"days", c.days}}; }
  json operator()(const age_less_than& c) const { return {{"type", "ageLessThan"}, {"days", c.days}}; }
  json operator()(const has_attachment&) const { return tagged("hasAttachment"); }
  json operator()(const is_unread&) const { return tagged("isUnread"); }
  json operator()(const is_read&) const { return tagged("isRead"); }
  json operator()(const has_action_items&) const { return tagged("hasActionItems"); }
  json operator()(const sender_is_vip&) const { return tagged("senderIsVIP"); }
};

struct action_encoder {
  json operator()(const set_category& a) const {
    return {{"type", "categorize"}, {"category", category_name(a.category)}};
  }
  json operator()(const set_priority& a) const { return {{"type", "setPriority"}, {"value", a.value}}; }
  json operator()(const delete_message&) const { return tagged("delete"); }
  json operator()(const archive_message&) const { return tagged("archive"); }
  json operator()(const mark_read&) const { return tagged("markRead"); }
  json operator()(const mark_unread&) const { return tagged("markUnread"); }
  json operator()(const move_to_mailbox& a) const { return {{"type", "move"}, {"mailbox", a.mailbox}}; }
  json operator()(const snooze_until& a) const { return {{"type", "snooze"}, {"date", time_to_json(a.until)}}; }
  json operator()(const add_tag& a) const { return {{"type", "addTag"}, {"tag", a.tag}}; }
  json operator()(const notify_user& a) const { return {{"type", "notify"}, {"message", a.text}}; }
  json operator()(const stop_processing&) const { return tagged("stopProcessing"); }
};

condition decode_condition(const json& j) {
  const json& p = tagged_payload(j);
  const std::string tag = p.at("type").get<std::string>();

  if (tag == "senderContains") return sender_contains{p.at("value").get<std::string>()};
  if (tag == "senderIs") return sender_is{p.at("value").get<std::string>()};
  if (tag == "senderDomain") return sender_domain{p.at("value").get<std::string>()};
  if (tag == "subjectContains") return subject_contains{p.at("value").get<std::string>()};
  if (tag == "bodyContains") return body_contains{p.at("value").get<std::string>()};
  if (tag == "categoryIs") return category_is{category_from_json(p.at("category"))};
  if (tag == "priorityGreaterThan") return priority_greater_than{p.at("value").get<int>()};
  if (tag == "priorityLessThan") return priority_less_than{p.at("value").get<int>()};
  if (tag == "ageGreaterThan") return age_greater_than{p.at("days").get<int>()};
  if (tag == "ageLessThan") return age_less_than{p.at("days").get<int>()};
  if (tag == "hasAttachment") return has_attachment{};
  if (tag == "isUnread") return is_unread{};
  if (tag == "isRead") return is_read{};
  if (tag == "hasActionItems") return has_action_items{};
  if (tag == "senderIsVIP") return sender_is_vip{};

  throw std::runtime_error("unknown condition type: " + tag);
}

action decode_action(const json& j) {
  const json& p = tagged_payload(j);
  const std::string tag = p.at("type").get<std::string>();

  if (tag == "categorize") return set_category{category_from_json(p.at("category"))};
  if (tag == "setPriority") return set_priority{p.at("value").get<int>()};
  if (tag == "delete") return delete_message{};
  if (tag == "archive") return archive_message{};
  if (tag == "markRead") return mark_read{};
  if (tag == "markUnread") return mark_unread{};
  if (tag == "move") return move_to_mailbox{p.at("mailbox").get<std::string>()};
  if (tag == "snooze") return snooze_until{time_from_json(p.at("date"))};
  if (tag == "addTag") return add_tag{p.at("tag").get<std::string>()};
  if (tag == "notify") return notify_user{p.at("message").get<std::string>()};
  if (tag == "stopProcessing") return stop_processing{};

  throw std::runtime_error("unknown action type: " + tag);
}

match_mode match_from_json(const json& j) {
  std::string v = text_util::to_lower(j.get<std::string>());
  if (v == "all") return match_mode::all;
  if (v == "any") return match_mode::any;
  throw std::runtime_error("unknown matchType: " + v);
}

rule decode_rule(const json& j) {
  if (!j.is_object()) throw std::runtime_error("rule must be an object");
  rule r;
  r.id = j.value("id", "");
  r.name = j.at("name").get<std::string>();
  r.enabled = j.value("isEnabled", true);
  r.priority = j.value("priority", 50);
  r.match = j.contains("matchType") ? match_from_json(j["matchType"]) : match_mode::all;
  for (const auto& cj : j.at("conditions")) r.conditions.push_back(decode_condition(cj));
  for (const auto& aj : j.at("actions")) r.actions.push_back(decode_action(aj));
  if (j.contains("createdAt")) r.created_at = time_from_json(j["createdAt"]);
  if (j.contains("lastModified")) r.last_modified = time_from_json(j["lastModified"]);
  r.execution_count = j.value("executionCount", 0);
  return r;
}

action_item decode_action_item(const json& j) {
  action_item item;
  if (j.contains("type") && !parse_action_item_kind(j["type"].get<std::string>(), item.kind)) {
    throw std::runtime_error("unknown action item type: " + j["type"].dump());
  }
  item.text = j.value("text", "");
  if (j.contains("date") && !j["date"].is_null()) item.due = time_from_json(j["date"]);
  return item;
}

message decode_message(const json& j) {
  if (!j.is_object()) throw std::runtime_error("message must be an object");
  message m;
  m.id = j.at("id").is_string() ? j["id"].get<std::string>() : j["id"].dump();
  m.ref = j.value("ref", m.id);
  m.sender = j.value("sender", "");
  m.sender_email = j.value("senderEmail", "");
  m.subject = j.value("subject", "");
  if (j.contains("body") && !j["body"].is_null()) m.body = j["body"].get<std::string>();
  m.received = time_from_json(j.at("dateReceived"));
  m.read = j.value("isRead", false);
  if (j.contains("category") && !j["category"].is_null()) m.category = category_from_json(j["category"]);
  if (j.contains("priority") && !j["priority"].is_null()) m.priority = j["priority"].get<int>();
  m.snoozed = j.value("isSnoozed", false);
  if (j.contains("snoozeUntil") && !j["snoozeUntil"].is_null()) {
    m.snooze_until = time_from_json(j["snoozeUntil"]);
  }
  if (j.contains("actions")) {
    for (const auto& ij : j["actions"]) m.action_items.push_back(decode_action_item(ij));
  }
  if (j.contains("senderReputation") && !j["senderReputation"].is_null()) {
    m.sender_reputation = j["senderReputation"].get<double>();
  }
  if (j.contains("tags")) m.tags = j["tags"].get<std::vector<std::string>>();
  return m;
}

}  // namespace

json condition_to_json(const condition& c) {
  return std::visit(condition_encoder{}, c);
}

bool condition_from_json(const json& j, condition& out, std::string& err) {
  try {
    out = decode_condition(j);
    return true;
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

json action_to_json(const action& a) {
  return std::visit(action_encoder{}, a);
}

bool action_from_json(const json& j, action& out, std::string& err) {
  try {
    out = decode_action(j);
    return true;
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

json rule_to_json(const rule& r) {
  json obj;
  obj["id"] = r.id;
  obj["name"] = r.name;
  obj["isEnabled"] = r.enabled;
  obj["priority"] = r.priority;
  obj["matchType"] = (r.match == match_mode::any) ? "any" : "all";

  json conds = json::array();
  for (const auto& c : r.conditions) conds.push_back(condition_to_json(c));
  obj["conditions"] = conds;

  json acts = json::array();
  for (const auto& a : r.actions) acts.push_back(action_to_json(a));
  obj["actions"] = acts;

  obj["createdAt"] = time_to_json(r.created_at);
  obj["lastModified"] = time_to_json(r.last_modified);
  obj["executionCount"] = r.execution_count;
  return obj;
}

bool rule_from_json(const json& j, rule& out, std::string& err) {
  try {
    out = decode_rule(j);
    return true;
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

std::string rules_to_json(const std::vector<rule>& rules) {
  json root;
  json arr = json::array();
  for (const auto& r : rules) arr.push_back(rule_to_json(r));
  root["rules"] = arr;
  return dump_text(root, 2);
}

bool rules_from_json(const std::string& text, std::vector<rule>& out, std::string* err) {
  json rules_json;
  if (!json_util::parse_collection(text, "rules", rules_json, err)) return false;

  std::vector<rule> result;
  for (size_t i = 0; i < rules_json.size(); i++) {
    rule r;
    std::string e;
    if (!rule_from_json(rules_json[i], r, e)) {
      if (err) *err = "rules[" + std::to_string(i) + "]: " + e;
      return false;
    }
    result.push_back(std::move(r));
  }

  out = std::move(result);
  return true;
}

std::string statistics_to_json(const run_statistics& stats) {
  json j;
  j["totalRules"] = stats.total_rules;
  j["enabledRules"] = stats.enabled_rules;
  j["totalExecutions"] = stats.total_executions;
  j["successfulExecutions"] = stats.successful_executions;
  j["failedExecutions"] = stats.failed_executions;
  j["lastExecutionDate"] = stats.last_execution ? time_to_json(*stats.last_execution) : json(nullptr);
  j["avgExecutionTime"] = stats.avg_execution_time;
  j["durationSamples"] = stats.duration_samples;
  j["durationTotal"] = stats.duration_total;
  j["successRate"] = stats.success_rate();
  return dump_text(j, 2);
}

bool statistics_from_json(const std::string& text, run_statistics& out, std::string* err) {
  json j;
  if (!json_util::parse(text, j, err)) return false;
  try {
    if (!j.is_object()) throw std::runtime_error("statistics must be an object");
    run_statistics s;
    s.total_rules = j.value("totalRules", 0);
    s.enabled_rules = j.value("enabledRules", 0);
    s.total_executions = j.value("totalExecutions", 0);
    s.successful_executions = j.value("successfulExecutions", 0);
    s.failed_executions = j.value("failedExecutions", 0);
    if (j.contains("lastExecutionDate") && !j["lastExecutionDate"].is_null()) {
      s.last_execution = time_from_json(j["lastExecutionDate"]);
    }
    s.avg_execution_time = j.value("avgExecutionTime", 0.0);
    s.duration_samples = j.value("durationSamples", 0L);
    s.duration_total = j.value("durationTotal", s.avg_execution_time * static_cast<double>(s.duration_samples));
    out = s;
    return true;
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    return false;
  }
}

json message_to_json(const message& msg) {
  json j;
  j["id"] = msg.id;
  j["ref"] = msg.ref;
  j["sender"] = msg.sender;
  j["senderEmail"] = msg.sender_email;
  j["subject"] = msg.subject;
  j["body"] = msg.body ? json(*msg.body) : json(nullptr);
  j["dateReceived"] = time_to_json(msg.received);
  j["isRead"] = msg.read;
  j["category"] = msg.category ? json(category_name(*msg.category)) : json(nullptr);
  j["priority"] = msg.priority ? json(*msg.priority) : json(nullptr);
  j["isSnoozed"] = msg.snoozed;
  j["snoozeUntil"] = msg.snooze_until ? time_to_json(*msg.snooze_until) : json(nullptr);

  json items = json::array();
  for (const auto& item : msg.action_items) {
    json ij;
    ij["type"] = action_item_kind_name(item.kind);
    ij["text"] = item.text;
    ij["date"] = item.due ? time_to_json(*item.due) : json(nullptr);
    items.push_back(ij);
  }
  j["actions"] = items;
  j["senderReputation"] = msg.sender_reputation ? json(*msg.sender_reputation) : json(nullptr);
  j["tags"] = msg.tags;
  return j;
}

bool message_from_json(const json& j, message& out, std::string& err) {
  try {
    out = decode_message(j);
    return true;
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

bool messages_from_json(const std::string& text, std::vector<message>& out, std::string* err) {
  json arr;
  if (!json_util::parse_collection(text, "messages", arr, err)) return false;

  std::vector<message> result;
  for (size_t i = 0; i < arr.size(); i++) {
    message m;
    std::string e;
    if (!message_from_json(arr[i], m, e)) {
      if (err) *err = "messages[" + std::to_string(i) + "]: " + e;
      return false;
    }
    result.push_back(std::move(m));
  }
  out = std::move(result);
  return true;
}

json side_effect_to_json(const side_effect& fx) {
  json j;
  j["type"] = side_effect_kind_name(fx.kind);
  j["ruleId"] = fx.rule_id;
  j["messageId"] = fx.message_id;
  j["ref"] = fx.ref;
  if (!fx.argument.empty()) j["argument"] = fx.argument;
  if (!fx.title.empty()) j["title"] = fx.title;
  return j;
}

json execution_result_to_json(const execution_result& res) {
  json j;
  j["ruleId"] = res.rule_id;
  j["ruleName"] = res.rule_name;
  j["matched"] = res.matched;
  j["actionsExecuted"] = res.actions_executed;
  j["errors"] = res.errors;
  j["executionTime"] = res.duration_sec;
  return j;
}

std::string run_result_to_json(const run_result& res) {
  json root;
  json msgs = json::array();
  for (const auto& m : res.messages) msgs.push_back(message_to_json(m));
  json results = json::array();
  for (const auto& r : res.results) results.push_back(execution_result_to_json(r));
  json effects = json::array();
  for (const auto& fx : res.side_effects) effects.push_back(side_effect_to_json(fx));
  root["messages"] = msgs;
  root["results"] = results;
  root["sideEffects"] = effects;
  return dump_text(root, 2);
}
