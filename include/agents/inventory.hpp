#pragma once

#include <filesystem>
#include <istream>
#include <set>
#include <string>

namespace wazuh_stats::agents {

class AgentInventory {
 public:
  virtual ~AgentInventory() = default;

  virtual std::set<std::string> known_agents() const = 0;
};

// Registered agents from the manager's client.keys file, one
// "<id> <name> <ip> <key>" entry per line. Entries commented out with '#' or
// whose name starts with '!' were removed and are not reported. The manager
// (000) is always known, even with no keys file.
class ClientKeysInventory final : public AgentInventory {
 public:
  explicit ClientKeysInventory(std::filesystem::path client_keys);

  std::set<std::string> known_agents() const override;

  static std::set<std::string> parse(std::istream& input);

 private:
  std::filesystem::path client_keys_;
};

}  // namespace wazuh_stats::agents
