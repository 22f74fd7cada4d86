#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "transport/socket_transport.hpp"

namespace wazuh_stats::mcp {

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

// Handlers throw std::invalid_argument on bad arguments and
// core::StatsError on platform failures.
ToolRegistry build_tool_registry(const core::StatsConfig& config, std::shared_ptr<transport::SocketTransport> transport);

}  // namespace wazuh_stats::mcp
