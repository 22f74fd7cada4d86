#include <cstdlib>
#include <iostream>
#include <memory>
#include <utility>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "transport/unix_socket.hpp"

int main() {
  wazuh_stats::core::StatsConfig config{};
  if (const char* config_path = std::getenv("WAZUH_STATS_CONFIG"); config_path != nullptr) {
    try {
      config = wazuh_stats::core::load_stats_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "[config] " << ex.what() << '\n';
      return 1;
    }
  }

  auto transport = std::make_shared<wazuh_stats::transport::UnixSocketTransport>(wazuh_stats::transport::UnixSocketOptions{
      .receive_timeout = config.socket.receive_timeout, .max_message_size = config.socket.max_message_size});

  wazuh_stats::mcp::Server server(wazuh_stats::mcp::build_tool_registry(config, std::move(transport)));
  return server.run(std::cin, std::cout, std::cerr);
}
