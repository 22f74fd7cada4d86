#include "core/errors.hpp"

#include <utility>

namespace wazuh_stats::core {
namespace {

std::string compose_message(const int code, const std::string& extra_message) {
  std::string message = describe_error(code);
  if (!extra_message.empty()) {
    message += ": ";
    message += extra_message;
  }
  return message;
}

}  // namespace

const char* error_kind_name(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::user:
      return "user";
    case ErrorKind::internal:
      return "internal";
    case ErrorKind::not_found:
      return "not_found";
  }
  return "user";
}

const char* describe_error(const int code) noexcept {
  switch (code) {
    case error_code::kSocketCommunication:
      return "Error communicating with socket";
    case error_code::kInvalidStatsTypes:
      return "Invalid types in stats file";
    case error_code::kDaemonStateUnavailable:
      return "Unable to get daemon state";
    case error_code::kSocketReceive:
      return "Could not read from socket";
    case error_code::kSocketConnect:
      return "Cannot connect to daemon socket";
    case error_code::kInvalidParameters:
      return "Invalid parameters";
    case error_code::kStatsFileMissing:
      return "Stats file does not exist";
    case error_code::kUnsupportedTarget:
      return "Operation not supported for this target";
    case error_code::kAgentNotFound:
      return "Agent does not exist";
    default:
      return "Unknown error";
  }
}

StatsError::StatsError(const int code, std::string extra_message)
    : StatsError(code, ErrorKind::user, std::move(extra_message)) {}

StatsError::StatsError(const int code, const ErrorKind kind, std::string extra_message)
    : std::runtime_error(compose_message(code, extra_message)),
      code_(code),
      kind_(kind),
      extra_message_(std::move(extra_message)) {}

InternalError::InternalError(const int code, std::string extra_message)
    : StatsError(code, ErrorKind::internal, std::move(extra_message)) {}

ResourceNotFound::ResourceNotFound(const int code, std::string extra_message)
    : StatsError(code, ErrorKind::not_found, std::move(extra_message)) {}

}  // namespace wazuh_stats::core
