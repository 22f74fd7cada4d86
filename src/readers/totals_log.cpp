#include "readers/totals_log.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/text.hpp"

namespace wazuh_stats::readers {
namespace {

constexpr std::size_t kAlertFieldCount = 4;
constexpr std::size_t kHourFieldCount = 5;

TotalsLine malformed() { return TotalsLine{.kind = TotalsLine::Kind::malformed}; }

}  // namespace

TotalsLine tokenize_totals_line(const std::string_view line) {
  const auto alert_fields = core::split(line, "-");
  if (alert_fields.size() == kAlertFieldCount) {
    const auto sigid = core::parse_int64(alert_fields[1]);
    const auto level = core::parse_int64(alert_fields[2]);
    const auto times = core::parse_int64(alert_fields[3]);
    if (!sigid || !level || !times) {
      return malformed();
    }
    return TotalsLine{.kind = TotalsLine::Kind::alert, .alert = {.sigid = *sigid, .level = *level, .times = *times}};
  }

  const auto hour_fields = core::split(line, "--");
  if (hour_fields.size() <= 1) {
    return TotalsLine{.kind = TotalsLine::Kind::skip};
  }
  if (hour_fields.size() != kHourFieldCount) {
    return malformed();
  }

  std::array<std::int64_t, kHourFieldCount> values{};
  for (std::size_t i = 0; i < kHourFieldCount; ++i) {
    const auto parsed = core::parse_int64(hour_fields[i]);
    if (!parsed) {
      return malformed();
    }
    values[i] = *parsed;
  }

  TotalsLine result{.kind = TotalsLine::Kind::hour};
  result.hour.hour = values[0];
  result.hour.total_alerts = values[1];
  result.hour.events = values[2];
  result.hour.syscheck = values[3];
  result.hour.firewall = values[4];
  return result;
}

TotalsLogParser::TotalsLogParser(std::filesystem::path stats_root) : stats_root_(std::move(stats_root)) {}

model::TotalsResult TotalsLogParser::totals() const { return totals(core::local_date_today()); }

model::TotalsResult TotalsLogParser::totals(const core::CivilDate& date) const {
  const auto path = totals_path(date);
  std::ifstream input(path);
  if (!input.is_open()) {
    throw core::StatsError(core::error_code::kStatsFileMissing, path.string());
  }

  model::TotalsResult result = parse(input);
  if (input.bad()) {
    throw core::StatsError(core::error_code::kStatsFileMissing, path.string());
  }
  return result;
}

std::filesystem::path TotalsLogParser::totals_path(const core::CivilDate& date) const {
  if (date.month < 1 || date.month > static_cast<int>(kMonthNames.size()) || date.day < 1 || date.day > 31) {
    throw core::StatsError(core::error_code::kInvalidParameters, "date out of range");
  }

  char file_name[32]{};
  std::snprintf(file_name, sizeof(file_name), "ossec-totals-%02d.log", date.day);
  return stats_root_ / "totals" / std::to_string(date.year) / kMonthNames[static_cast<std::size_t>(date.month - 1)] /
         file_name;
}

model::TotalsResult TotalsLogParser::parse(std::istream& input) {
  model::TotalsResult result{};
  std::vector<model::AlertRecord> pending_alerts;

  std::string line;
  while (std::getline(input, line)) {
    TotalsLine token = tokenize_totals_line(line);
    switch (token.kind) {
      case TotalsLine::Kind::alert:
        pending_alerts.push_back(token.alert);
        break;
      case TotalsLine::Kind::hour:
        token.hour.alerts = std::move(pending_alerts);
        pending_alerts.clear();
        result.affected.push_back(std::move(token.hour));
        break;
      case TotalsLine::Kind::skip:
        break;
      case TotalsLine::Kind::malformed:
        result.failed = true;
        return result;
    }
  }

  return result;
}

}  // namespace wazuh_stats::readers
