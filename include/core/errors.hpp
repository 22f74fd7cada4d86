#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wazuh_stats::core {

namespace error_code {

constexpr int kSocketCommunication = 1014;
constexpr int kInvalidStatsTypes = 1104;
constexpr int kDaemonStateUnavailable = 1117;
constexpr int kSocketReceive = 1118;
constexpr int kSocketConnect = 1121;
constexpr int kInvalidParameters = 1307;
constexpr int kStatsFileMissing = 1308;
constexpr int kUnsupportedTarget = 1310;
constexpr int kAgentNotFound = 1701;

}  // namespace error_code

enum class ErrorKind : std::uint8_t {
  user = 0,
  internal = 1,
  not_found = 2,
};

const char* error_kind_name(ErrorKind kind) noexcept;

// Base description for a platform error code; "Unknown error" if unlisted.
const char* describe_error(int code) noexcept;

// Platform error family. what() is "<description>: <extra_message>" when an
// extra message is present, else the bare description.
class StatsError : public std::runtime_error {
 public:
  explicit StatsError(int code, std::string extra_message = {});

  int code() const noexcept { return code_; }
  ErrorKind kind() const noexcept { return kind_; }
  const std::string& extra_message() const noexcept { return extra_message_; }

 protected:
  StatsError(int code, ErrorKind kind, std::string extra_message);

 private:
  int code_;
  ErrorKind kind_;
  std::string extra_message_;
};

class InternalError : public StatsError {
 public:
  explicit InternalError(int code, std::string extra_message = {});
};

class ResourceNotFound : public StatsError {
 public:
  explicit ResourceNotFound(int code, std::string extra_message = {});
};

}  // namespace wazuh_stats::core
