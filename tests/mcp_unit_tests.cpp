#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "transport/unix_socket.hpp"

using wazuh_stats::mcp::Server;
using wazuh_stats::mcp::build_tool_registry;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

nlohmann::json call(const Server& server, const nlohmann::json& request) {
  bool should_respond = true;
  return server.handle_request(request, should_respond);
}

Server make_server(const std::filesystem::path& install_root) {
  const auto config = wazuh_stats::core::stats_config_for_root(install_root);
  return Server(build_tool_registry(config, std::make_shared<wazuh_stats::transport::UnixSocketTransport>()));
}

int test_tools_list_exposes_stats_tools() {
  const Server server = make_server("/nonexistent/wazuh");
  const auto response = call(server, {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});

  const auto& tools = response.at("result").at("tools");
  if (tools.size() != 6U) {
    return fail("test_tools_list_exposes_stats_tools", "expected six tools");
  }
  bool has_daemon_state = false;
  for (const auto& tool : tools) {
    has_daemon_state = has_daemon_state || tool.at("name") == "stats.daemon_state";
  }
  if (!has_daemon_state) {
    return fail("test_tools_list_exposes_stats_tools", "stats.daemon_state missing");
  }
  return 0;
}

int test_hourly_tool_on_empty_stats_root() {
  const auto root = std::filesystem::temp_directory_path() / ("wazuh_stats_mcp_" + std::to_string(::getpid()));
  std::filesystem::create_directories(root);
  const Server server = make_server(root);

  const auto response = call(server, {{"jsonrpc", "2.0"},
                                      {"id", "h"},
                                      {"method", "tools/call"},
                                      {"params", {{"name", "stats.hourly"}, {"arguments", nlohmann::json::object()}}}});
  std::filesystem::remove_all(root);

  const auto& content = response.at("result").at("content");
  if (!content.is_array() || content.size() != 1U || content[0].at("averages").size() != 24U ||
      content[0].at("interactions") != 0) {
    return fail("test_hourly_tool_on_empty_stats_root", "hourly content mismatch");
  }
  return 0;
}

int test_platform_errors_become_rpc_errors() {
  const Server server = make_server("/nonexistent/wazuh");

  const auto unsupported =
      call(server, {{"jsonrpc", "2.0"},
                    {"id", 7},
                    {"method", "tools/call"},
                    {"params", {{"name", "stats.daemon_state"}, {"arguments", {{"agent_id", "000"}, {"daemon", "agent"}}}}}});
  if (unsupported.at("error").at("code") != wazuh_stats::mcp::rpc_error::kPlatform ||
      unsupported.at("error").at("data").at("code") != 1310) {
    return fail("test_platform_errors_become_rpc_errors", "unsupported target should map to a platform error");
  }

  const auto missing_totals =
      call(server, {{"jsonrpc", "2.0"},
                    {"id", 8},
                    {"method", "tools/call"},
                    {"params", {{"name", "stats.totals"}, {"arguments", {{"date", "2021-03-07"}}}}}});
  if (missing_totals.at("error").at("data").at("code") != 1308) {
    return fail("test_platform_errors_become_rpc_errors", "missing totals log should map to 1308");
  }

  const auto bad_args =
      call(server, {{"jsonrpc", "2.0"},
                    {"id", 9},
                    {"method", "tools/call"},
                    {"params", {{"name", "stats.daemon_file"}, {"arguments", {{"path", 3}}}}}});
  if (bad_args.at("error").at("code") != wazuh_stats::mcp::rpc_error::kInvalidParams) {
    return fail("test_platform_errors_become_rpc_errors", "bad arguments should be invalid params");
  }
  return 0;
}

int test_run_loop_skips_notifications() {
  const Server server = make_server("/nonexistent/wazuh");
  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"method\":\"tools/list\"}\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"initialize\",\"params\":{}}\n"
      "not json\n");
  std::ostringstream out;
  std::ostringstream err;

  if (server.run(in, out, err) != 0) {
    return fail("test_run_loop_skips_notifications", "run should exit cleanly at end of input");
  }

  std::istringstream lines(out.str());
  std::string first;
  std::string second;
  std::string extra;
  std::getline(lines, first);
  std::getline(lines, second);
  if (std::getline(lines, extra)) {
    return fail("test_run_loop_skips_notifications", "notifications must not be answered");
  }

  const auto initialized = nlohmann::json::parse(first);
  const auto parse_error = nlohmann::json::parse(second);
  if (initialized.at("id") != 3 || initialized.at("result").at("serverInfo").at("name") != "wazuh-stats-mcp") {
    return fail("test_run_loop_skips_notifications", "initialize response mismatch");
  }
  if (parse_error.at("error").at("code") != wazuh_stats::mcp::rpc_error::kInternal || err.str().empty()) {
    return fail("test_run_loop_skips_notifications", "unparsable line should produce an internal error");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_tools_list_exposes_stats_tools(); rc != 0) return rc;
  if (int rc = test_hourly_tool_on_empty_stats_root(); rc != 0) return rc;
  if (int rc = test_platform_errors_become_rpc_errors(); rc != 0) return rc;
  if (int rc = test_run_loop_skips_notifications(); rc != 0) return rc;

  std::cout << "[PASS] mcp unit tests\n";
  return 0;
}
