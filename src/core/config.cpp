#include "core/config.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/text.hpp"

namespace wazuh_stats::core {
namespace {

// Paths given explicitly in the file win over the ones derived from
// paths.install_root, regardless of key order.
struct ExplicitPaths {
  std::optional<std::filesystem::path> stats_root{};
  std::optional<std::filesystem::path> sockets_dir{};
  std::optional<std::filesystem::path> client_keys{};
};

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::filesystem::path parse_path(const std::string& key, const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument(key + " must not be empty");
  }
  return std::filesystem::path(value);
}

void apply_key_value(StatsConfig& config, ExplicitPaths& explicit_paths, const std::string& key,
                     const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "paths.install_root") {
    config.install_root = parse_path(key, value);
    return;
  }

  if (key == "paths.stats_root") {
    explicit_paths.stats_root = parse_path(key, value);
    return;
  }

  if (key == "paths.sockets_dir") {
    explicit_paths.sockets_dir = parse_path(key, value);
    return;
  }

  if (key == "paths.client_keys") {
    explicit_paths.client_keys = parse_path(key, value);
    return;
  }

  if (key == "date_format") {
    if (value.empty()) {
      throw std::invalid_argument("date_format must not be empty");
    }
    config.date_format = value;
    return;
  }

  if (key == "socket.receive_timeout_ms") {
    const auto timeout_ms = parse_int64(value);
    if (!timeout_ms) {
      throw std::invalid_argument("socket.receive_timeout_ms must be an integer");
    }
    if (*timeout_ms < 0) {
      throw std::runtime_error("socket.receive_timeout_ms must be greater than or equal to 0");
    }
    config.socket.receive_timeout = std::chrono::milliseconds(*timeout_ms);
    return;
  }

  if (key == "socket.max_message_size") {
    const auto size = parse_int64(value);
    if (!size) {
      throw std::invalid_argument("socket.max_message_size must be an integer");
    }
    if (*size <= 0) {
      throw std::runtime_error("socket.max_message_size must be greater than 0");
    }
    config.socket.max_message_size = static_cast<std::size_t>(*size);
  }
}

}  // namespace

StatsConfig stats_config_for_root(const std::filesystem::path& install_root) {
  StatsConfig config{};
  config.install_root = install_root;
  config.stats_root = install_root / "stats";
  config.sockets_dir = install_root / "queue" / "sockets";
  config.client_keys = install_root / "etc" / "client.keys";
  return config;
}

StatsConfig load_stats_config(const std::string& path) {
  StatsConfig config{};
  ExplicitPaths explicit_paths{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(std::string_view(stripped).substr(0, colon_pos));
    const std::string value = trim(std::string_view(stripped).substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    } else if (sections.size() < depth) {
      throw std::invalid_argument("unexpected indentation for key: " + key);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, explicit_paths, full_key.str(), value);
  }

  const StatsConfig derived = stats_config_for_root(config.install_root);
  config.stats_root = explicit_paths.stats_root.value_or(derived.stats_root);
  config.sockets_dir = explicit_paths.sockets_dir.value_or(derived.sockets_dir);
  config.client_keys = explicit_paths.client_keys.value_or(derived.client_keys);
  return config;
}

}  // namespace wazuh_stats::core
