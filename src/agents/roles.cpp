#include "agents/roles.hpp"

#include <utility>

namespace researchguard::agents {

namespace {

constexpr std::uint32_t Bits(Capability capability) {
  return static_cast<std::uint32_t>(capability);
}

constexpr RoleSpec kRoleSpecs[kRoleCount] = {
    {AgentRole::kPlanner, "planner",
     "You are a Research Planner. Break down the query into 2-3 search topics. Be brief.",
     Bits(Capability::kNone)},
    {AgentRole::kResearcher, "researcher",
     "You are a Researcher. Make ONE web_search and ONE paper_search call. Be concise.",
     Bits(Capability::kWebSearch) | Bits(Capability::kPaperSearch)},
    {AgentRole::kWriter, "writer",
     "You are a Writer. Synthesize findings into a brief response with citations. Keep it "
     "short.",
     Bits(Capability::kNone)},
    {AgentRole::kCritic, "critic",
     "You are a Critic. Evaluate briefly and say TERMINATE if acceptable.",
     Bits(Capability::kNone)},
};

} // namespace

const RoleSpec& GetRoleSpec(AgentRole role) {
  return kRoleSpecs[static_cast<std::size_t>(role)];
}

const char* ToString(AgentRole role) {
  return GetRoleSpec(role).name;
}

bool ParseAgentRole(std::string_view raw, AgentRole& role) {
  for (const auto& spec : kRoleSpecs) {
    if (raw == spec.name) {
      role = spec.role;
      return true;
    }
  }
  return false;
}

const char* ToString(Capability capability) {
  switch (capability) {
  case Capability::kNone:
    return "none";
  case Capability::kWebSearch:
    return "web_search";
  case Capability::kPaperSearch:
    return "paper_search";
  }

  return "none";
}

bool ParseCapability(std::string_view raw, Capability& capability) {
  if (raw == "web_search") {
    capability = Capability::kWebSearch;
    return true;
  }
  if (raw == "paper_search") {
    capability = Capability::kPaperSearch;
    return true;
  }
  return false;
}

bool HasCapability(AgentRole role, Capability capability) {
  if (capability == Capability::kNone) {
    return false;
  }
  return (GetRoleSpec(role).capabilities & Bits(capability)) != 0U;
}

AgentRole RoleForTurn(std::size_t turn_index) {
  return kRoleSpecs[turn_index % kRoleCount].role;
}

RoleDirectives::RoleDirectives() {
  for (std::size_t i = 0; i < kRoleCount; ++i) {
    directives_[i] = kRoleSpecs[i].default_directive;
  }
}

const std::string& RoleDirectives::Get(AgentRole role) const {
  return directives_[static_cast<std::size_t>(role)];
}

void RoleDirectives::Set(AgentRole role, std::string directive) {
  directives_[static_cast<std::size_t>(role)] = std::move(directive);
}

} // namespace researchguard::agents
