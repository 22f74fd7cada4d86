#include "model/stats_records.hpp"

namespace wazuh_stats::model {

void to_json(nlohmann::json& out, const HourlyAverage& value) {
  out = nlohmann::json{{"averages", value.averages}, {"interactions", value.interactions}};
}

void to_json(nlohmann::json& out, const DayAverage& value) {
  out = nlohmann::json{{value.day, {{"hours", value.hours}, {"interactions", value.interactions}}}};
}

void to_json(nlohmann::json& out, const AlertRecord& value) {
  out = nlohmann::json{{"sigid", value.sigid}, {"level", value.level}, {"times", value.times}};
}

void to_json(nlohmann::json& out, const TotalsRecord& value) {
  out = nlohmann::json{{"hour", value.hour},
                       {"alerts", value.alerts},
                       {"totalAlerts", value.total_alerts},
                       {"events", value.events},
                       {"syscheck", value.syscheck},
                       {"firewall", value.firewall}};
}

void to_json(nlohmann::json& out, const TotalsResult& value) {
  out = nlohmann::json{{"failed", value.failed}, {"affected", value.affected}};
}

nlohmann::json error_to_json(const core::StatsError& error) {
  return nlohmann::json{{"code", error.code()}, {"kind", core::error_kind_name(error.kind())}, {"message", error.what()}};
}

void to_json(nlohmann::json& out, const AgentFailure& value) {
  out = nlohmann::json{{"id", value.agent_id}, {"error", error_to_json(value.error)}};
}

void to_json(nlohmann::json& out, const AgentStatsResult& value) {
  out = nlohmann::json{{"failed", value.failed}, {"affected", value.affected}};
}

}  // namespace wazuh_stats::model
