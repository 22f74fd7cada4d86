#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "core/timestamp.hpp"

namespace wazuh_stats::core {

struct SocketConfig {
  std::chrono::milliseconds receive_timeout{0};  // 0 blocks until a frame arrives
  std::size_t max_message_size{65536};
};

struct StatsConfig {
  std::filesystem::path install_root{"/var/ossec"};
  std::filesystem::path stats_root{"/var/ossec/stats"};
  std::filesystem::path sockets_dir{"/var/ossec/queue/sockets"};
  std::filesystem::path client_keys{"/var/ossec/etc/client.keys"};
  std::string date_format{kDefaultDateFormat};
  SocketConfig socket{};
};

// Default layout rooted at `install_root`.
StatsConfig stats_config_for_root(const std::filesystem::path& install_root);

StatsConfig load_stats_config(const std::string& path);

}  // namespace wazuh_stats::core
