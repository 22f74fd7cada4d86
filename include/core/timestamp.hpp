#pragma once

#include <optional>
#include <string>

namespace wazuh_stats::core {

// Timestamp layout used by daemons when reporting keepalive/ack times.
constexpr const char* kDaemonTimestampFormat = "%Y-%m-%d %H:%M:%S";

// Platform default for dates handed back to callers.
constexpr const char* kDefaultDateFormat = "%Y-%m-%dT%H:%M:%SZ";

struct CivilDate {
  int year{1970};
  int month{1};  // 1..12
  int day{1};    // 1..31
};

CivilDate local_date_today();

// Parses "YYYY-MM-DD"; nullopt on anything else or on an out-of-range field.
std::optional<CivilDate> parse_civil_date(const std::string& text);

// Reads `text` with strptime(source_format) and renders it with
// strftime(target_format). nullopt when the text does not fully match.
std::optional<std::string> reformat_timestamp(const std::string& text, const char* source_format,
                                              const std::string& target_format);

}  // namespace wazuh_stats::core
