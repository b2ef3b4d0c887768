#pragma once

#include "agents/conversation.hpp"
#include "agents/roles.hpp"
#include "core/cancellation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace researchguard::agents {

// Fragments recorded when a tool finds nothing or fails.
inline constexpr const char* kNoWebResults = "No web results found.";
inline constexpr const char* kNoPaperResults = "No academic papers found.";

// Narrowing applied to paper_search results. Year bounds are inclusive; a
// paper without a year never passes a year bound.
struct PaperFilter {
  std::optional<int> year_from;
  std::optional<int> year_to;
  std::uint32_t min_citations = 0;
};

// Tool call the generator asks for on behalf of the speaking role. Whether it
// runs is decided by the coordinator, never by the generator. The year and
// citation fields only apply to paper_search.
struct ToolRequest {
  Capability capability = Capability::kWebSearch;
  std::string query;
  std::optional<int> year_from;
  std::optional<int> year_to;
  std::uint32_t min_citations = 0;
};

// Everything one role needs to produce its next message. `transcript` points
// at the committed turns and stays valid for the duration of the call.
struct GenerationRequest {
  AgentRole role = AgentRole::kPlanner;
  std::string directive;
  std::string query;
  const std::vector<ConversationTurn>* transcript = nullptr;
};

struct GenerationReply {
  std::string content;
  std::vector<ToolRequest> tool_requests;
};

// Language-generation backend contract.
//
// Contract:
// - Returns true and fills `reply` on success.
// - Returns false with `error` populated on failure; the coordinator retries
//   under its attempt budget.
// - Implementations should poll `cancel` and return early when it fires.
class IGenerator {
public:
  virtual ~IGenerator() = default;

  virtual bool Generate(const GenerationRequest& request, const core::CancellationToken& cancel,
                        GenerationReply& reply, std::string& error) = 0;
};

// Research tool contract. `output` is the formatted text shown to the next
// roles. A false return is recovered in-turn by the coordinator.
class IResearchTools {
public:
  virtual ~IResearchTools() = default;

  virtual bool WebSearch(const std::string& query, const core::CancellationToken& cancel,
                         std::string& output, std::string& error) = 0;

  virtual bool PaperSearch(const std::string& query, const PaperFilter& filter,
                           const core::CancellationToken& cancel, std::string& output,
                           std::string& error) = 0;
};

} // namespace researchguard::agents
