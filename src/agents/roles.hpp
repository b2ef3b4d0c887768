#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace researchguard::agents {

// Fixed participant set. The enumerator order is the turn order.
enum class AgentRole {
  kPlanner = 0,
  kResearcher = 1,
  kWriter = 2,
  kCritic = 3,
};

inline constexpr std::size_t kRoleCount = 4;

// Tool capabilities a role may hold, as bit flags.
enum class Capability : std::uint32_t {
  kNone = 0,
  kWebSearch = 1U << 0U,
  kPaperSearch = 1U << 1U,
};

struct RoleSpec {
  AgentRole role;
  const char* name;
  const char* default_directive;
  std::uint32_t capabilities;
};

// Static description of every role, indexed by AgentRole.
const RoleSpec& GetRoleSpec(AgentRole role);

const char* ToString(AgentRole role);
bool ParseAgentRole(std::string_view raw, AgentRole& role);

const char* ToString(Capability capability);
bool ParseCapability(std::string_view raw, Capability& capability);

bool HasCapability(AgentRole role, Capability capability);

// Role that speaks at zero-based turn `turn_index`.
AgentRole RoleForTurn(std::size_t turn_index);

// Per-conversation directive set. Starts from the built-in defaults; the
// configuration may override any role.
class RoleDirectives {
public:
  RoleDirectives();

  const std::string& Get(AgentRole role) const;
  void Set(AgentRole role, std::string directive);

private:
  std::array<std::string, kRoleCount> directives_;
};

} // namespace researchguard::agents
