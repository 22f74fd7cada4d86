#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agents/component_stats.hpp"
#include "agents/inventory.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "daemon/daemon_stats_client.hpp"
#include "model/stats_records.hpp"
#include "readers/averages.hpp"
#include "readers/daemon_stats_file.hpp"
#include "readers/totals_log.hpp"
#include "transport/unix_socket.hpp"

namespace {

constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
  out << "usage: wazuh-stats [-c config.yaml] <command> [args]\n"
         "  hourly\n"
         "  weekly\n"
         "  totals [YYYY-MM-DD]\n"
         "  daemon-file <path>\n"
         "  daemon-state <agent_id> <daemon>\n"
         "  agent-stats <component> <agent_id>...\n";
}

std::string format_config_settings(const wazuh_stats::core::StatsConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[wazuh-stats] config " << (config_path.empty() ? "<defaults>" : config_path)
         << " | stats_root=" << config.stats_root.string() << " | sockets_dir=" << config.sockets_dir.string()
         << " | client_keys=" << config.client_keys.string() << " | date_format=" << config.date_format
         << " | receive_timeout_ms=" << config.socket.receive_timeout.count();
  return output.str();
}

std::shared_ptr<wazuh_stats::transport::SocketTransport> make_transport(const wazuh_stats::core::StatsConfig& config) {
  return std::make_shared<wazuh_stats::transport::UnixSocketTransport>(wazuh_stats::transport::UnixSocketOptions{
      .receive_timeout = config.socket.receive_timeout, .max_message_size = config.socket.max_message_size});
}

// Null when the command or its argument count is not recognized.
nlohmann::json run_command(const wazuh_stats::core::StatsConfig& config, const std::string& command,
                           const std::vector<std::string>& args) {
  using namespace wazuh_stats;

  if (command == "hourly" && args.empty()) {
    return readers::AverageReader(config.stats_root).hourly();
  }

  if (command == "weekly" && args.empty()) {
    return readers::AverageReader(config.stats_root).weekly();
  }

  if (command == "totals" && args.size() <= 1) {
    const readers::TotalsLogParser parser(config.stats_root);
    if (args.empty()) {
      return parser.totals();
    }
    const auto date = core::parse_civil_date(args[0]);
    if (!date) {
      throw core::StatsError(core::error_code::kInvalidParameters, "date must be YYYY-MM-DD");
    }
    return parser.totals(*date);
  }

  if (command == "daemon-file" && args.size() == 1) {
    const auto result = readers::read_daemon_stats(args[0]);
    if (result.error) {
      throw *result.error;
    }
    return result.items;
  }

  if (command == "daemon-state" && args.size() == 2) {
    const daemon::DaemonStatsClient client(config, make_transport(config));
    return client.get_daemon_state(args[0], args[1]);
  }

  if (command == "agent-stats" && args.size() >= 2) {
    const daemon::DaemonStatsClient client(config, make_transport(config));
    const agents::ClientKeysInventory inventory(config.client_keys);
    agents::DaemonStateAccessor accessor(client);
    const agents::ComponentStatsAggregator aggregator(inventory, accessor);
    const std::vector<std::string> agent_ids(args.begin() + 1, args.end());
    return aggregator.collect(agent_ids, args[0]);
  }

  return nullptr;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "-c") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  } else if (const char* env_path = std::getenv("WAZUH_STATS_CONFIG"); env_path != nullptr) {
    config_path = env_path;
  }

  if (args.empty()) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  wazuh_stats::core::StatsConfig config{};
  if (!config_path.empty()) {
    try {
      config = wazuh_stats::core::load_stats_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "[config] " << ex.what() << '\n';
      return kExitError;
    }
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  const std::string command = args.front();
  const std::vector<std::string> command_args(args.begin() + 1, args.end());

  try {
    const nlohmann::json output = run_command(config, command, command_args);
    if (output.is_null()) {
      print_usage(std::cerr);
      return kExitUsage;
    }
    std::cout << output.dump() << '\n';
  } catch (const wazuh_stats::core::StatsError& ex) {
    std::cerr << "[wazuh-stats] " << command << " failed: " << ex.what() << '\n';
    std::cout << nlohmann::json{{"error", ex.code()}, {"message", ex.what()}}.dump() << '\n';
    return kExitError;
  } catch (const std::exception& ex) {
    std::cerr << "[wazuh-stats] " << command << " failed: " << ex.what() << '\n';
    return kExitError;
  }

  return 0;
}
