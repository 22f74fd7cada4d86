#pragma once

#include <filesystem>
#include <istream>

#include "model/stats_records.hpp"

namespace wazuh_stats::readers {

// Reads a daemon state file made of key='value' lines such as
//   queue_size='0'
// Lines holding a '#' and empty lines are ignored; a later key overwrites an
// earlier one. Throws core::StatsError (stats file missing) when `path` cannot
// be opened. A present but unparsable file is reported through
// DaemonStatsResult::error rather than thrown.
model::DaemonStatsResult read_daemon_stats(const std::filesystem::path& path);

model::DaemonStatsResult parse_daemon_stats(std::istream& input);

}  // namespace wazuh_stats::readers
