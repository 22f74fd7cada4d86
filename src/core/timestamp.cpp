#include "core/timestamp.hpp"

#include <chrono>
#include <ctime>

#include <time.h>

#include "core/text.hpp"

namespace wazuh_stats::core {

CivilDate local_date_today() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  return CivilDate{.year = local.tm_year + 1900, .month = local.tm_mon + 1, .day = local.tm_mday};
}

std::optional<CivilDate> parse_civil_date(const std::string& text) {
  const auto fields = split(text, "-");
  if (fields.size() != 3 || fields[0].size() != 4 || fields[1].size() != 2 || fields[2].size() != 2) {
    return std::nullopt;
  }

  const auto year = parse_int64(fields[0]);
  const auto month = parse_int64(fields[1]);
  const auto day = parse_int64(fields[2]);
  if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1 || *day > 31) {
    return std::nullopt;
  }

  return CivilDate{.year = static_cast<int>(*year), .month = static_cast<int>(*month), .day = static_cast<int>(*day)};
}

std::optional<std::string> reformat_timestamp(const std::string& text, const char* source_format,
                                              const std::string& target_format) {
  std::tm parsed{};
  const char* end = strptime(text.c_str(), source_format, &parsed);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  parsed.tm_isdst = -1;

  char buffer[128]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), target_format.c_str(), &parsed);
  if (written == 0U && !target_format.empty()) {
    return std::nullopt;
  }
  return std::string(buffer, written);
}

}  // namespace wazuh_stats::core
