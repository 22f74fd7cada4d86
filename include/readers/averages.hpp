#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "model/stats_records.hpp"

namespace wazuh_stats::readers {

// Day names for weekly-average/<index>, index 0 being Sunday.
constexpr std::array<const char*, model::kDaysPerWeek> kWeekDays = {"Sun", "Mon", "Tue", "Wed",
                                                                     "Thu", "Fri", "Sat"};

// Reads the bucket files the analysis daemon keeps under
// <stats_root>/hourly-average and <stats_root>/weekly-average/<day>.
// Files 0..23 hold one hour counter each and file 24 the interaction count.
// A bucket file that cannot be opened reads as 0.
class AverageReader {
 public:
  explicit AverageReader(std::filesystem::path stats_root);

  std::vector<model::HourlyAverage> hourly() const;
  std::vector<model::DayAverage> weekly() const;

 private:
  // Fills the 24 hour buckets plus the interaction count from `directory`.
  static void read_bucket_directory(const std::filesystem::path& directory, model::HourBuckets& hours,
                                    std::int64_t& interactions);
  static std::int64_t read_bucket(const std::filesystem::path& file);

  std::filesystem::path stats_root_;
};

}  // namespace wazuh_stats::readers
