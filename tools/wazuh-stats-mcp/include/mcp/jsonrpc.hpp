#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wazuh_stats::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

namespace rpc_error {

constexpr int kInvalidParams = -32602;
constexpr int kMethodNotFound = -32601;
constexpr int kInternal = -32603;
// Raised tool failed with a platform error; `data` carries its code.
constexpr int kPlatform = -32000;

}  // namespace rpc_error

struct JsonRpcError {
  int code;
  std::string message;
  nlohmann::json data{};
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace wazuh_stats::mcp
