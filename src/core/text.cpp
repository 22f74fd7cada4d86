#include "core/text.hpp"

#include <cctype>
#include <charconv>

namespace wazuh_stats::core {
namespace {

bool is_blank(const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string_view trim_view(std::string_view value) {
  while (!value.empty() && is_blank(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_blank(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

std::string trim(const std::string_view value) { return std::string(trim_view(value)); }

std::vector<std::string_view> split(const std::string_view value, const std::string_view separator) {
  std::vector<std::string_view> fields;
  if (separator.empty()) {
    fields.push_back(value);
    return fields;
  }

  std::size_t begin = 0;
  while (true) {
    const auto pos = value.find(separator, begin);
    if (pos == std::string_view::npos) {
      fields.push_back(value.substr(begin));
      break;
    }
    fields.push_back(value.substr(begin, pos - begin));
    begin = pos + separator.size();
  }
  return fields;
}

std::vector<std::string_view> split_whitespace(const std::string_view value) {
  std::vector<std::string_view> fields;
  std::size_t i = 0;
  while (i < value.size()) {
    while (i < value.size() && is_blank(value[i])) {
      ++i;
    }
    const std::size_t begin = i;
    while (i < value.size() && !is_blank(value[i])) {
      ++i;
    }
    if (i > begin) {
      fields.push_back(value.substr(begin, i - begin));
    }
  }
  return fields;
}

std::optional<std::int64_t> parse_int64(const std::string_view value) noexcept {
  std::string_view digits = trim_view(value);
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
    if (!digits.empty() && digits.front() == '-') {
      return std::nullopt;
    }
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  std::int64_t parsed = 0;
  const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (result.ec != std::errc{} || result.ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> parse_double(const std::string_view value) noexcept {
  std::string_view text = trim_view(value);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }

  double parsed = 0.0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), parsed, std::chars_format::general);
  if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace wazuh_stats::core
