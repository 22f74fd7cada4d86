#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wazuh_stats::core {

std::string trim(std::string_view value);

// Splits on every occurrence of a non-empty separator, keeping empty fields:
// "a--b" split on "-" yields {"a", "", "b"}.
std::vector<std::string_view> split(std::string_view value, std::string_view separator);

// Splits on runs of blanks, dropping empty fields.
std::vector<std::string_view> split_whitespace(std::string_view value);

// Whole-string integer parse; surrounding whitespace is allowed.
std::optional<std::int64_t> parse_int64(std::string_view value) noexcept;

// Whole-string floating point parse; surrounding whitespace is allowed.
std::optional<double> parse_double(std::string_view value) noexcept;

}  // namespace wazuh_stats::core
