#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agents/inventory.hpp"
#include "daemon/daemon_stats_client.hpp"
#include "model/stats_records.hpp"

namespace wazuh_stats::agents {

// Fetches the stats payload of one component on one agent. Known failure
// conditions are raised as core::StatsError.
class AgentStatsAccessor {
 public:
  virtual ~AgentStatsAccessor() = default;

  virtual nlohmann::json fetch(const std::string& agent_id, const std::string& component) = 0;
};

// Asks the agent's component for its state over the dispatch socket.
class DaemonStateAccessor final : public AgentStatsAccessor {
 public:
  explicit DaemonStateAccessor(const daemon::DaemonStatsClient& client);

  nlohmann::json fetch(const std::string& agent_id, const std::string& component) override;

 private:
  const daemon::DaemonStatsClient& client_;
};

class ComponentStatsAggregator {
 public:
  ComponentStatsAggregator(const AgentInventory& inventory, AgentStatsAccessor& accessor);

  // Every input id lands in exactly one of failed/affected, both kept in
  // input order. Unknown ids fail with core::ResourceNotFound; a
  // core::StatsError from the accessor fails only that agent. Any other
  // exception propagates.
  model::AgentStatsResult collect(const std::vector<std::string>& agent_ids, const std::string& component) const;

 private:
  const AgentInventory& inventory_;
  AgentStatsAccessor& accessor_;
};

}  // namespace wazuh_stats::agents
