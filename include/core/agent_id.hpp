#pragma once

#include <string>

namespace wazuh_stats::core {

// The manager always owns agent slot 000.
constexpr const char* kManagerAgentId = "000";

// Left-pads with zeros to three characters; longer ids are returned unchanged.
inline std::string normalize_agent_id(const std::string& agent_id) {
  if (agent_id.size() >= 3) {
    return agent_id;
  }
  return std::string(3 - agent_id.size(), '0') + agent_id;
}

}  // namespace wazuh_stats::core
