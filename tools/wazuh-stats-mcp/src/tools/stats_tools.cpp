#include "mcp/tools.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "agents/component_stats.hpp"
#include "agents/inventory.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "daemon/daemon_stats_client.hpp"
#include "model/stats_records.hpp"
#include "readers/averages.hpp"
#include "readers/daemon_stats_file.hpp"
#include "readers/totals_log.hpp"

namespace wazuh_stats::mcp {

namespace {

std::string require_string(const nlohmann::json& params, const char* name) {
  const auto it = params.find(name);
  if (it == params.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(name) + " must be a string");
  }
  return it->get<std::string>();
}

nlohmann::json object_schema(nlohmann::json properties, nlohmann::json required) {
  return nlohmann::json{{"type", "object"},
                        {"properties", std::move(properties)},
                        {"required", std::move(required)},
                        {"additionalProperties", false}};
}

nlohmann::json handle_totals(const core::StatsConfig& config, const nlohmann::json& params) {
  const readers::TotalsLogParser parser(config.stats_root);
  if (params.find("date") == params.end()) {
    return parser.totals();
  }

  const auto date = core::parse_civil_date(require_string(params, "date"));
  if (!date) {
    throw std::invalid_argument("date must be YYYY-MM-DD");
  }
  return parser.totals(*date);
}

nlohmann::json handle_daemon_file(const nlohmann::json& params) {
  const auto result = readers::read_daemon_stats(require_string(params, "path"));
  if (result.error) {
    throw *result.error;
  }
  return result.items;
}

nlohmann::json handle_agent_component(const daemon::DaemonStatsClient& client, const core::StatsConfig& config,
                                      const nlohmann::json& params) {
  const auto ids_it = params.find("agents");
  if (ids_it == params.end() || !ids_it->is_array()) {
    throw std::invalid_argument("agents must be an array of strings");
  }

  std::vector<std::string> agent_ids;
  agent_ids.reserve(ids_it->size());
  for (const auto& id : *ids_it) {
    if (!id.is_string()) {
      throw std::invalid_argument("agents must be an array of strings");
    }
    agent_ids.push_back(id.get<std::string>());
  }

  const agents::ClientKeysInventory inventory(config.client_keys);
  agents::DaemonStateAccessor accessor(client);
  const agents::ComponentStatsAggregator aggregator(inventory, accessor);
  return aggregator.collect(agent_ids, require_string(params, "component"));
}

}  // namespace

ToolRegistry build_tool_registry(const core::StatsConfig& config, std::shared_ptr<transport::SocketTransport> transport) {
  ToolRegistry registry;
  auto client = std::make_shared<const daemon::DaemonStatsClient>(config, std::move(transport));

  Tool hourly{.name = "stats.hourly",
              .description = "Hourly alert averages and the interaction count.",
              .input_schema = object_schema(nlohmann::json::object(), nlohmann::json::array()),
              .handler = [config](const nlohmann::json&) -> nlohmann::json {
                return readers::AverageReader(config.stats_root).hourly();
              }};

  Tool weekly{.name = "stats.weekly",
              .description = "Per weekday hourly alert averages.",
              .input_schema = object_schema(nlohmann::json::object(), nlohmann::json::array()),
              .handler = [config](const nlohmann::json&) -> nlohmann::json {
                return readers::AverageReader(config.stats_root).weekly();
              }};

  Tool totals{.name = "stats.totals",
              .description = "Per hour alert totals for a day (defaults to today).",
              .input_schema = object_schema({{"date", {{"type", "string"}}}}, nlohmann::json::array()),
              .handler = [config](const nlohmann::json& params) { return handle_totals(config, params); }};

  Tool daemon_file{.name = "stats.daemon_file",
                   .description = "Counters from a daemon key='value' state file.",
                   .input_schema = object_schema({{"path", {{"type", "string"}}}}, {"path"}),
                   .handler = handle_daemon_file};

  Tool daemon_state{.name = "stats.daemon_state",
                    .description = "Live state of a daemon on the manager (000) or an agent.",
                    .input_schema = object_schema({{"agent_id", {{"type", "string"}}}, {"daemon", {{"type", "string"}}}},
                                                  {"agent_id", "daemon"}),
                    .handler = [client](const nlohmann::json& params) {
                      return client->get_daemon_state(require_string(params, "agent_id"),
                                                      require_string(params, "daemon"));
                    }};

  Tool agent_component{
      .name = "stats.agent_component",
      .description = "Component state for a list of agents, split into failed and affected.",
      .input_schema = object_schema({{"agents", {{"type", "array"}, {"items", {{"type", "string"}}}}},
                                     {"component", {{"type", "string"}}}},
                                    {"agents", "component"}),
      .handler = [client, config](const nlohmann::json& params) {
        return handle_agent_component(*client, config, params);
      }};

  for (Tool* tool : {&hourly, &weekly, &totals, &daemon_file, &daemon_state, &agent_component}) {
    registry.emplace(tool->name, std::move(*tool));
  }
  return registry;
}

}  // namespace wazuh_stats::mcp
