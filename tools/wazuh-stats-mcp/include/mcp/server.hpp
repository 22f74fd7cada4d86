#pragma once

#include <iosfwd>

#include "mcp/tools.hpp"

namespace wazuh_stats::mcp {

// Line-delimited JSON-RPC 2.0 over a pair of streams.
class Server {
 public:
  explicit Server(ToolRegistry tools);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

 private:
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;

  ToolRegistry tools_;
};

}  // namespace wazuh_stats::mcp
