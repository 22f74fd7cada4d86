#include "agents/inventory.hpp"

#include <fstream>
#include <utility>

#include "core/agent_id.hpp"
#include "core/text.hpp"

namespace wazuh_stats::agents {
namespace {

constexpr std::size_t kClientKeysFieldCount = 4;

}  // namespace

ClientKeysInventory::ClientKeysInventory(std::filesystem::path client_keys) : client_keys_(std::move(client_keys)) {}

std::set<std::string> ClientKeysInventory::known_agents() const {
  std::ifstream input(client_keys_);
  if (!input.is_open()) {
    return {core::kManagerAgentId};
  }
  return parse(input);
}

std::set<std::string> ClientKeysInventory::parse(std::istream& input) {
  std::set<std::string> agents{core::kManagerAgentId};

  std::string line;
  while (std::getline(input, line)) {
    const auto fields = core::split_whitespace(line);
    if (fields.size() < kClientKeysFieldCount) {
      continue;
    }
    if (fields[0].front() == '#' || fields[1].front() == '!') {
      continue;
    }
    agents.insert(core::normalize_agent_id(std::string(fields[0])));
  }

  return agents;
}

}  // namespace wazuh_stats::agents
