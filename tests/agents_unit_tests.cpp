#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "agents/component_stats.hpp"
#include "agents/inventory.hpp"
#include "core/errors.hpp"
#include "daemon/daemon_stats_client.hpp"
#include "transport/socket_transport.hpp"

using wazuh_stats::agents::AgentInventory;
using wazuh_stats::agents::AgentStatsAccessor;
using wazuh_stats::agents::ClientKeysInventory;
using wazuh_stats::agents::ComponentStatsAggregator;
using wazuh_stats::agents::DaemonStateAccessor;
using wazuh_stats::core::ErrorKind;
using wazuh_stats::core::StatsError;

namespace {

class FixedInventory final : public AgentInventory {
 public:
  explicit FixedInventory(std::set<std::string> agents) : agents_(std::move(agents)) {}

  std::set<std::string> known_agents() const override {
    ++calls;
    return agents_;
  }

  mutable int calls{0};

 private:
  std::set<std::string> agents_;
};

// Returns {"agent": id, "component": c}; ids listed in `failing` raise a
// platform error and `crashing` raises something outside that family.
class ScriptedAccessor final : public AgentStatsAccessor {
 public:
  nlohmann::json fetch(const std::string& agent_id, const std::string& component) override {
    fetched.push_back(agent_id);
    if (agent_id == failing) {
      throw StatsError(wazuh_stats::core::error_code::kDaemonStateUnavailable, "agent disconnected");
    }
    if (agent_id == crashing) {
      throw std::logic_error("unexpected accessor failure");
    }
    return nlohmann::json{{"agent", agent_id}, {"component", component}};
  }

  std::string failing{};
  std::string crashing{};
  std::vector<std::string> fetched{};
};

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_client_keys_inventory_parsing() {
  std::istringstream keys(
      "001 web-01 10.0.0.5 3a4c0f2e9b\n"
      "002 !retired-02 any 77aa1c\n"
      "#003 db-03 10.0.0.7 8812ff\n"
      "4 legacy any 1234abcd\n"
      "malformed line\n"
      "\n");

  const auto agents = ClientKeysInventory::parse(keys);
  const std::set<std::string> expected{"000", "001", "004"};
  if (agents != expected) {
    return fail("test_client_keys_inventory_parsing", "inventory should hold the manager and active agents only");
  }

  const ClientKeysInventory missing(std::filesystem::temp_directory_path() / "wazuh_stats_missing_client.keys");
  if (missing.known_agents() != std::set<std::string>{"000"}) {
    return fail("test_client_keys_inventory_parsing", "missing keys file should yield the manager only");
  }
  return 0;
}

int test_unknown_agents_fail_without_fetch() {
  const FixedInventory inventory({"000", "001"});
  ScriptedAccessor accessor{};
  const ComponentStatsAggregator aggregator(inventory, accessor);

  const auto result = aggregator.collect({"001", "009"}, "logcollector");
  if (inventory.calls != 1) {
    return fail("test_unknown_agents_fail_without_fetch", "inventory should be read once per batch");
  }
  if (result.affected.size() != 1U || result.affected[0].at("agent") != "001" ||
      result.affected[0].at("component") != "logcollector") {
    return fail("test_unknown_agents_fail_without_fetch", "known agent payload mismatch");
  }
  if (result.failed.size() != 1U || result.failed[0].agent_id != "009" ||
      result.failed[0].error.kind() != ErrorKind::not_found ||
      result.failed[0].error.code() != wazuh_stats::core::error_code::kAgentNotFound) {
    return fail("test_unknown_agents_fail_without_fetch", "unknown agent should fail with resource not found");
  }
  if (accessor.fetched != std::vector<std::string>{"001"}) {
    return fail("test_unknown_agents_fail_without_fetch", "unknown agents must not be fetched");
  }
  return 0;
}

int test_per_agent_errors_do_not_abort_batch() {
  const FixedInventory inventory({"000", "001", "002", "003"});
  ScriptedAccessor accessor{};
  accessor.failing = "002";
  const ComponentStatsAggregator aggregator(inventory, accessor);

  const auto result = aggregator.collect({"003", "002", "404", "001"}, "agent");
  if (result.affected.size() != 2U || result.affected[0].at("agent") != "003" || result.affected[1].at("agent") != "001") {
    return fail("test_per_agent_errors_do_not_abort_batch", "successes should keep input order");
  }
  if (result.failed.size() != 2U || result.failed[0].agent_id != "002" || result.failed[1].agent_id != "404") {
    return fail("test_per_agent_errors_do_not_abort_batch", "failures should keep input order");
  }
  if (result.failed[0].error.code() != wazuh_stats::core::error_code::kDaemonStateUnavailable ||
      result.failed[0].error.extra_message() != "agent disconnected") {
    return fail("test_per_agent_errors_do_not_abort_batch", "accessor error should be kept with its agent");
  }

  const nlohmann::json rendered = result;
  if (rendered["failed"][1]["id"] != "404" || rendered["failed"][1]["error"]["code"] != 1701 ||
      rendered["affected"].size() != 2U) {
    return fail("test_per_agent_errors_do_not_abort_batch", "json rendering mismatch");
  }
  return 0;
}

int test_unexpected_errors_propagate() {
  const FixedInventory inventory({"000", "001", "002"});
  ScriptedAccessor accessor{};
  accessor.crashing = "001";
  const ComponentStatsAggregator aggregator(inventory, accessor);

  try {
    (void)aggregator.collect({"001", "002"}, "agent");
  } catch (const std::logic_error&) {
    if (accessor.fetched != std::vector<std::string>{"001"}) {
      return fail("test_unexpected_errors_propagate", "batch should stop at the unexpected failure");
    }
    return 0;
  }
  return fail("test_unexpected_errors_propagate", "non-platform errors should propagate");
}

class RefusingTransport final : public wazuh_stats::transport::SocketTransport {
 public:
  std::unique_ptr<wazuh_stats::transport::SocketConnection> open(const std::filesystem::path&) override {
    throw wazuh_stats::transport::SocketError("connect failed: Connection refused");
  }
};

int test_daemon_state_accessor_failures_are_per_agent() {
  const wazuh_stats::daemon::DaemonStatsClient client(wazuh_stats::core::stats_config_for_root("/var/ossec"),
                                                      std::make_shared<RefusingTransport>());
  DaemonStateAccessor accessor(client);
  const FixedInventory inventory({"000", "001"});
  const ComponentStatsAggregator aggregator(inventory, accessor);

  const auto result = aggregator.collect({"001", "000"}, "agent");
  if (!result.affected.empty() || result.failed.size() != 2U) {
    return fail("test_daemon_state_accessor_failures_are_per_agent", "both agents should fail individually");
  }
  if (result.failed[0].error.code() != wazuh_stats::core::error_code::kSocketConnect ||
      result.failed[0].error.kind() != ErrorKind::internal) {
    return fail("test_daemon_state_accessor_failures_are_per_agent", "socket failure should map to 1121");
  }
  if (result.failed[1].error.code() != wazuh_stats::core::error_code::kUnsupportedTarget) {
    return fail("test_daemon_state_accessor_failures_are_per_agent", "manager agent daemon should be unsupported");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_client_keys_inventory_parsing(); rc != 0) return rc;
  if (int rc = test_unknown_agents_fail_without_fetch(); rc != 0) return rc;
  if (int rc = test_per_agent_errors_do_not_abort_batch(); rc != 0) return rc;
  if (int rc = test_unexpected_errors_propagate(); rc != 0) return rc;
  if (int rc = test_daemon_state_accessor_failures_are_per_agent(); rc != 0) return rc;

  std::cout << "[PASS] agents unit tests\n";
  return 0;
}
