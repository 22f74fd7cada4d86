#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "mcp/jsonrpc.hpp"

namespace wazuh_stats::mcp {

Server::Server(ToolRegistry tools) : tools_(std::move(tools)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    bool should_respond = true;
    try {
      const auto request = nlohmann::json::parse(line);
      const auto response = handle_request(request, should_respond);
      if (should_respond) {
        out << response.dump() << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "wazuh-stats-mcp: failed to process request: " << ex.what() << '\n';
      if (should_respond) {
        out << make_error_response(nullptr, JsonRpcError{.code = rpc_error::kInternal, .message = "internal error"})
                   .dump()
            << '\n';
        out.flush();
      }
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  nlohmann::json id = nullptr;
  try {
    const auto parsed = parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    if (parsed.method == "initialize") {
      return make_result_response(id, handle_initialize(parsed.params));
    }
    if (parsed.method == "tools/list") {
      return make_result_response(id, handle_tools_list());
    }
    if (parsed.method == "tools/call") {
      return make_result_response(id, handle_tools_call(parsed.params));
    }

    return make_error_response(id, JsonRpcError{.code = rpc_error::kMethodNotFound, .message = "method not found"});
  } catch (const std::invalid_argument& ex) {
    if (!should_respond) {
      return {};
    }
    return make_error_response(id, JsonRpcError{.code = rpc_error::kInvalidParams, .message = ex.what()});
  } catch (const core::StatsError& ex) {
    if (!should_respond) {
      return {};
    }
    return make_error_response(
        id, JsonRpcError{.code = rpc_error::kPlatform,
                         .message = ex.what(),
                         .data = {{"code", ex.code()}, {"kind", core::error_kind_name(ex.kind())}}});
  }
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  return nlohmann::json{{"serverInfo", {{"name", "wazuh-stats-mcp"}, {"version", "0.1.0"}}},
                        {"capabilities", {{"tools", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw std::invalid_argument("unknown tool");
  }

  return nlohmann::json{{"content", tool_it->second.handler(arguments)}};
}

}  // namespace wazuh_stats::mcp
