#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string_view>

#include "core/timestamp.hpp"
#include "model/stats_records.hpp"

namespace wazuh_stats::readers {

constexpr std::array<const char*, 12> kMonthNames = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Classification of one totals log line.
//   alert:     "<hour>-<sigid>-<level>-<times>"
//   hour:      "<hour>--<alerts>--<events>--<syscheck>--<firewall>"
//   skip:      no "--" separator at all (blank or header noise)
//   malformed: anything else
struct TotalsLine {
  enum class Kind : std::uint8_t { alert, hour, skip, malformed };

  Kind kind{Kind::skip};
  model::AlertRecord alert{};
  model::TotalsRecord hour{};
};

TotalsLine tokenize_totals_line(std::string_view line);

class TotalsLogParser {
 public:
  explicit TotalsLogParser(std::filesystem::path stats_root);

  // Totals for today's local date.
  model::TotalsResult totals() const;

  // Throws core::StatsError (stats file missing) when the day's log cannot be opened.
  model::TotalsResult totals(const core::CivilDate& date) const;

  // <stats_root>/totals/<year>/<Mon>/ossec-totals-<dd>.log
  std::filesystem::path totals_path(const core::CivilDate& date) const;

  // Stops at the first malformed line and returns failed=true with the hours
  // closed so far. Alerts after the last hour line are not reported.
  static model::TotalsResult parse(std::istream& input);

 private:
  std::filesystem::path stats_root_;
};

}  // namespace wazuh_stats::readers
