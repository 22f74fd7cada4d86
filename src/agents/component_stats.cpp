#include "agents/component_stats.hpp"

#include <iostream>
#include <set>

#include "core/agent_id.hpp"
#include "core/errors.hpp"

namespace wazuh_stats::agents {

DaemonStateAccessor::DaemonStateAccessor(const daemon::DaemonStatsClient& client) : client_(client) {}

nlohmann::json DaemonStateAccessor::fetch(const std::string& agent_id, const std::string& component) {
  return client_.get_daemon_state(agent_id, component);
}

ComponentStatsAggregator::ComponentStatsAggregator(const AgentInventory& inventory, AgentStatsAccessor& accessor)
    : inventory_(inventory), accessor_(accessor) {}

model::AgentStatsResult ComponentStatsAggregator::collect(const std::vector<std::string>& agent_ids,
                                                          const std::string& component) const {
  const std::set<std::string> known_agents = inventory_.known_agents();

  model::AgentStatsResult result{};
  for (const auto& agent_id : agent_ids) {
    try {
      if (known_agents.count(core::normalize_agent_id(agent_id)) == 0U) {
        throw core::ResourceNotFound(core::error_code::kAgentNotFound);
      }
      result.affected.push_back(accessor_.fetch(agent_id, component));
    } catch (const core::StatsError& ex) {
      std::cerr << "[agent-stats] agent " << agent_id << " " << component << ": " << ex.what() << '\n';
      result.failed.push_back(model::AgentFailure{.agent_id = agent_id, .error = ex});
    }
  }

  return result;
}

}  // namespace wazuh_stats::agents
