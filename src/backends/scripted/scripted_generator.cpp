#include "backends/scripted/scripted_generator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <limits>
#include <utility>

namespace researchguard::backends::scripted {

namespace {

using JsonValue = core::json::Value;

constexpr int kMinYear = 0;
constexpr int kMaxYear = 9999;
constexpr std::uint32_t kMaxFailAttempts = 1000;
// One hour.
constexpr std::uint32_t kMaxDelayMs = 3600000;

template <typename Integer>
bool ReadOptionalInteger(const JsonValue& object, std::string_view key, const std::string& path,
                         Integer min_value, Integer max_value, Integer& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!core::json::ReadBoundedInteger(*value, min_value, max_value, out)) {
    error = path + "." + std::string(key) + " must be an integer in [" +
            std::to_string(min_value) + ", " + std::to_string(max_value) + "]";
    return false;
  }
  return true;
}

bool ParseToolRequest(const JsonValue& item, const std::string& path,
                      agents::ToolRequest& request, std::string& error) {
  if (!item.IsObject()) {
    error = path + " must be an object";
    return false;
  }
  const JsonValue* tool = item.Find("tool");
  if (tool == nullptr || !tool->IsString() ||
      !agents::ParseCapability(tool->string_value, request.capability)) {
    error = path + ".tool must be web_search or paper_search";
    return false;
  }
  const JsonValue* query = item.Find("query");
  if (query == nullptr || !query->IsString()) {
    error = path + ".query must be a string";
    return false;
  }
  request.query = query->string_value;
  int year = 0;
  if (item.Find("year_from") != nullptr) {
    if (!ReadOptionalInteger(item, "year_from", path, kMinYear, kMaxYear, year, error)) {
      return false;
    }
    request.year_from = year;
  }
  if (item.Find("year_to") != nullptr) {
    if (!ReadOptionalInteger(item, "year_to", path, kMinYear, kMaxYear, year, error)) {
      return false;
    }
    request.year_to = year;
  }
  return ReadOptionalInteger(item, "min_citations", path, std::uint32_t{0},
                             std::numeric_limits<std::uint32_t>::max(), request.min_citations,
                             error);
}

bool ParseTurn(const JsonValue& item, const std::string& path, ScriptedTurn& turn,
               std::string& error) {
  if (!item.IsObject()) {
    error = path + " must be an object";
    return false;
  }
  const JsonValue* role = item.Find("role");
  if (role == nullptr || !role->IsString() ||
      !agents::ParseAgentRole(role->string_value, turn.role)) {
    error = path + ".role must be one of planner|researcher|writer|critic";
    return false;
  }
  const JsonValue* content = item.Find("content");
  if (content == nullptr || !content->IsString()) {
    error = path + ".content must be a string";
    return false;
  }
  turn.content = content->string_value;

  if (const JsonValue* requests = item.Find("tool_requests"); requests != nullptr) {
    if (!requests->IsArray()) {
      error = path + ".tool_requests must be an array";
      return false;
    }
    for (std::size_t i = 0; i < requests->array_value.size(); ++i) {
      agents::ToolRequest request;
      if (!ParseToolRequest(requests->array_value[i],
                            path + ".tool_requests[" + std::to_string(i) + "]", request, error)) {
        return false;
      }
      turn.tool_requests.push_back(std::move(request));
    }
  }

  std::uint32_t delay_ms = 0;
  if (!ReadOptionalInteger(item, "fail_attempts", path, std::uint32_t{0}, kMaxFailAttempts,
                           turn.fail_attempts, error) ||
      !ReadOptionalInteger(item, "delay_ms", path, std::uint32_t{0}, kMaxDelayMs, delay_ms,
                           error)) {
    return false;
  }
  turn.delay = std::chrono::milliseconds(delay_ms);
  return true;
}

} // namespace

bool LoadScriptText(std::string_view text, std::vector<ScriptedTurn>& turns,
                    std::string& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid script JSON: " + parse_error;
    return false;
  }
  const JsonValue* turn_list = root.Find("turns");
  if (turn_list == nullptr || !turn_list->IsArray()) {
    error = "script must be an object with a turns array";
    return false;
  }

  std::vector<ScriptedTurn> parsed;
  for (std::size_t i = 0; i < turn_list->array_value.size(); ++i) {
    ScriptedTurn turn;
    if (!ParseTurn(turn_list->array_value[i], "turns[" + std::to_string(i) + "]", turn, error)) {
      return false;
    }
    parsed.push_back(std::move(turn));
  }
  if (parsed.empty()) {
    error = "script turns cannot be empty";
    return false;
  }

  turns = std::move(parsed);
  return true;
}

bool LoadScriptFile(const std::filesystem::path& path, std::vector<ScriptedTurn>& turns,
                    std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!LoadScriptText(text, turns, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

ScriptedGenerator::ScriptedGenerator(std::vector<ScriptedTurn> turns) : turns_(std::move(turns)) {}

bool ScriptedGenerator::Generate(const agents::GenerationRequest& request,
                                 const core::CancellationToken& cancel,
                                 agents::GenerationReply& reply, std::string& error) {
  const std::size_t turn_index = request.transcript == nullptr ? 0U : request.transcript->size();

  const ScriptedTurn* turn = nullptr;
  bool fail_this_attempt = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++call_count_;
    last_directive_ = request.directive;

    // Returning to an earlier turn, or repeating one that already succeeded,
    // means a new conversation: its turns get their failure budgets back.
    if (last_turn_index_.has_value() &&
        (turn_index < last_turn_index_.value() ||
         (turn_index == last_turn_index_.value() && last_call_succeeded_))) {
      failures_used_.clear();
    }
    last_turn_index_ = turn_index;
    last_call_succeeded_ = false;

    if (turn_index >= turns_.size()) {
      error = "script has no entry for turn " + std::to_string(turn_index);
      return false;
    }
    turn = &turns_[turn_index];
    if (turn->role != request.role) {
      error = "script entry for turn " + std::to_string(turn_index) + " is for role " +
              agents::ToString(turn->role) + ", requested " + agents::ToString(request.role);
      return false;
    }

    std::uint32_t& used = failures_used_[turn_index];
    if (used < turn->fail_attempts) {
      ++used;
      fail_this_attempt = true;
      error = "scripted generation failure " + std::to_string(used) + " of " +
              std::to_string(turn->fail_attempts) + " for turn " + std::to_string(turn_index);
    }
  }
  if (fail_this_attempt) {
    return false;
  }

  if (turn->delay.count() > 0 && !cancel.SleepFor(turn->delay)) {
    error = "generation cancelled";
    return false;
  }

  reply.content = turn->content;
  reply.tool_requests = turn->tool_requests;
  {
    std::lock_guard<std::mutex> lock(mu_);
    last_call_succeeded_ = true;
  }
  return true;
}

std::size_t ScriptedGenerator::CallCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return call_count_;
}

std::string ScriptedGenerator::LastDirective() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_directive_;
}

} // namespace researchguard::backends::scripted
