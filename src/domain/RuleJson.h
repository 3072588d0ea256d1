#pragma once

#include "Message.h"
#include "Rule.h"
#include "Stats.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

nlohmann::json condition_to_json(const condition& c);
bool condition_from_json(const nlohmann::json& j, condition& out, std::string& err);

nlohmann::json action_to_json(const action& a);
bool action_from_json(const nlohmann::json& j, action& out, std::string& err);

nlohmann::json rule_to_json(const rule& r);
bool rule_from_json(const nlohmann::json& j, rule& out, std::string& err);

// Accepts a bare array or {"rules": [...]}. Nothing is written to `out`
// unless every rule decodes.
std::string rules_to_json(const std::vector<rule>& rules);
bool rules_from_json(const std::string& text, std::vector<rule>& out, std::string* err);

std::string statistics_to_json(const run_statistics& stats);
bool statistics_from_json(const std::string& text, run_statistics& out, std::string* err);

nlohmann::json message_to_json(const message& msg);
bool message_from_json(const nlohmann::json& j, message& out, std::string& err);
bool messages_from_json(const std::string& text, std::vector<message>& out, std::string* err);

nlohmann::json side_effect_to_json(const side_effect& fx);
nlohmann::json execution_result_to_json(const execution_result& res);
std::string run_result_to_json(const run_result& res);
