#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace wazuh_stats::model {

constexpr std::size_t kHoursPerDay = 24;
constexpr std::size_t kDaysPerWeek = 7;

using HourBuckets = std::array<std::int64_t, kHoursPerDay>;

struct HourlyAverage {
  HourBuckets averages{};
  std::int64_t interactions{0};
};

struct DayAverage {
  std::string day;
  HourBuckets hours{};
  std::int64_t interactions{0};
};

struct AlertRecord {
  std::int64_t sigid{0};
  std::int64_t level{0};
  std::int64_t times{0};
};

// One closed hour of a totals log with the alerts listed before it.
struct TotalsRecord {
  std::int64_t hour{0};
  std::vector<AlertRecord> alerts{};
  std::int64_t total_alerts{0};
  std::int64_t events{0};
  std::int64_t syscheck{0};
  std::int64_t firewall{0};
};

struct TotalsResult {
  bool failed{false};
  std::vector<TotalsRecord> affected{};
};

using DaemonStats = std::map<std::string, double>;

// Either the parsed stats (one element) or the reason the file was rejected.
struct DaemonStatsResult {
  std::vector<DaemonStats> items{};
  std::optional<core::InternalError> error{};
};

struct AgentFailure {
  std::string agent_id;
  core::StatsError error;
};

struct AgentStatsResult {
  std::vector<AgentFailure> failed{};
  std::vector<nlohmann::json> affected{};
};

void to_json(nlohmann::json& out, const HourlyAverage& value);
void to_json(nlohmann::json& out, const DayAverage& value);
void to_json(nlohmann::json& out, const AlertRecord& value);
void to_json(nlohmann::json& out, const TotalsRecord& value);
void to_json(nlohmann::json& out, const TotalsResult& value);
void to_json(nlohmann::json& out, const AgentFailure& value);
void to_json(nlohmann::json& out, const AgentStatsResult& value);

// {"code", "kind", "message"} rendering of a platform error.
nlohmann::json error_to_json(const core::StatsError& error);

}  // namespace wazuh_stats::model
