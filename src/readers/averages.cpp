#include "readers/averages.hpp"

#include <fstream>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "core/text.hpp"

namespace wazuh_stats::readers {

AverageReader::AverageReader(std::filesystem::path stats_root) : stats_root_(std::move(stats_root)) {}

std::vector<model::HourlyAverage> AverageReader::hourly() const {
  model::HourlyAverage average{};
  read_bucket_directory(stats_root_ / "hourly-average", average.averages, average.interactions);
  return {average};
}

std::vector<model::DayAverage> AverageReader::weekly() const {
  std::vector<model::DayAverage> week;
  week.reserve(kWeekDays.size());
  for (std::size_t day = 0; day < kWeekDays.size(); ++day) {
    model::DayAverage average{};
    average.day = kWeekDays[day];
    read_bucket_directory(stats_root_ / "weekly-average" / std::to_string(day), average.hours,
                          average.interactions);
    week.push_back(std::move(average));
  }
  return week;
}

void AverageReader::read_bucket_directory(const std::filesystem::path& directory, model::HourBuckets& hours,
                                          std::int64_t& interactions) {
  for (std::size_t hour = 0; hour < hours.size(); ++hour) {
    hours[hour] = read_bucket(directory / std::to_string(hour));
  }
  interactions = read_bucket(directory / std::to_string(model::kHoursPerDay));
}

std::int64_t AverageReader::read_bucket(const std::filesystem::path& file) {
  std::ifstream input(file);
  if (!input.is_open()) {
    return 0;
  }

  // getline turns read errors (a directory, EIO) into badbit instead of throwing.
  std::string content;
  std::string line;
  while (std::getline(input, line)) {
    content += line;
    content += '\n';
  }
  if (input.bad()) {
    return 0;
  }

  const auto value = core::parse_int64(content);
  if (!value) {
    throw core::InternalError(core::error_code::kInvalidStatsTypes, file.string());
  }
  return *value;
}

}  // namespace wazuh_stats::readers
