#include "readers/daemon_stats_file.hpp"

#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include "core/errors.hpp"
#include "core/text.hpp"

namespace wazuh_stats::readers {
namespace {

struct StatLine {
  std::string key;
  double value{0.0};
  std::string error;  // non-empty when the line could not be parsed
};

// `line` comes without its newline. The value is the text between the first
// and second '=' minus its first and last character (the quotes).
StatLine tokenize_stat_line(const std::string_view line) {
  const auto fields = core::split(line, "=");
  if (fields.size() < 2) {
    return StatLine{.error = "missing '=' in line '" + std::string(line) + "'"};
  }

  const std::string_view quoted = fields[1];
  const std::string_view unquoted = quoted.size() >= 2 ? quoted.substr(1, quoted.size() - 2) : std::string_view{};
  const auto value = core::parse_double(unquoted);
  if (!value) {
    return StatLine{.error = "could not convert string to float: '" + std::string(unquoted) + "'"};
  }

  return StatLine{.key = std::string(fields[0]), .value = *value};
}

}  // namespace

model::DaemonStatsResult read_daemon_stats(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw core::StatsError(core::error_code::kStatsFileMissing, path.string());
  }

  model::DaemonStatsResult result = parse_daemon_stats(input);
  if (input.bad()) {
    throw core::StatsError(core::error_code::kStatsFileMissing, path.string());
  }
  return result;
}

model::DaemonStatsResult parse_daemon_stats(std::istream& input) {
  model::DaemonStats stats;

  std::string line;
  while (std::getline(input, line)) {
    // A lone character on the final, unterminated line counts as empty too.
    const std::size_t raw_length = line.size() + (input.eof() ? 0U : 1U);
    if (raw_length <= 1 || line.find('#') != std::string::npos) {
      continue;
    }

    StatLine parsed = tokenize_stat_line(line);
    if (!parsed.error.empty()) {
      return model::DaemonStatsResult{
          .error = core::InternalError(core::error_code::kInvalidStatsTypes, std::move(parsed.error))};
    }
    stats[parsed.key] = parsed.value;
  }

  return model::DaemonStatsResult{.items = {std::move(stats)}};
}

}  // namespace wazuh_stats::readers
