#include "daemon/daemon_stats_client.hpp"

#include <array>
#include <iostream>
#include <utility>

#include "core/agent_id.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace wazuh_stats::daemon {
namespace {

constexpr std::array<const char*, 2> kTimestampFields = {"last_keepalive", "last_ack"};
constexpr const char* kDispatchSocket = "request";
constexpr const char* kGetStateCommand = "getstate";

bool manager_lacks_daemon(const std::string& daemon) { return daemon == "agent"; }

DaemonReply error_envelope(const std::string& raw) {
  const auto space = raw.find(' ');
  return DaemonReply{.ok = false, .error_message = space == std::string::npos ? raw : raw.substr(space + 1)};
}

}  // namespace

DaemonReply decode_daemon_reply(const std::string& raw, const std::string& date_format) {
  const auto document = nlohmann::json::parse(raw, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return error_envelope(raw);
  }

  const auto data_it = document.find("data");
  if (data_it == document.end() || !data_it->is_object()) {
    return error_envelope(raw);
  }

  nlohmann::json data = *data_it;
  for (const char* field : kTimestampFields) {
    const auto field_it = data.find(field);
    if (field_it == data.end()) {
      continue;
    }
    if (!field_it->is_string()) {
      return error_envelope(raw);
    }
    auto formatted =
        core::reformat_timestamp(field_it->get<std::string>(), core::kDaemonTimestampFormat, date_format);
    if (!formatted) {
      return error_envelope(raw);
    }
    *field_it = std::move(*formatted);
  }

  return DaemonReply{.ok = true, .data = std::move(data)};
}

DaemonStatsClient::DaemonStatsClient(core::StatsConfig config, std::shared_ptr<transport::SocketTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

DaemonRequest DaemonStatsClient::build_request(const std::string& agent_id, const std::string& daemon) const {
  if (agent_id.empty() || daemon.empty()) {
    throw core::StatsError(core::error_code::kInvalidParameters);
  }

  const std::string normalized_id = core::normalize_agent_id(agent_id);
  if (normalized_id == core::kManagerAgentId) {
    if (manager_lacks_daemon(daemon)) {
      throw core::StatsError(core::error_code::kUnsupportedTarget);
    }
    return DaemonRequest{.socket_path = config_.sockets_dir / daemon, .command = kGetStateCommand};
  }

  return DaemonRequest{.socket_path = config_.sockets_dir / kDispatchSocket,
                       .command = normalized_id + " " + daemon + " " + kGetStateCommand};
}

nlohmann::json DaemonStatsClient::get_daemon_state(const std::string& agent_id, const std::string& daemon) const {
  const DaemonRequest request = build_request(agent_id, daemon);
  const std::string response = exchange(request);

  DaemonReply reply = decode_daemon_reply(response, config_.date_format);
  if (!reply.ok) {
    throw core::StatsError(core::error_code::kDaemonStateUnavailable, reply.error_message);
  }
  return std::move(reply.data);
}

std::string DaemonStatsClient::exchange(const DaemonRequest& request) const {
  std::unique_ptr<transport::SocketConnection> connection;
  try {
    connection = transport_->open(request.socket_path);
  } catch (const transport::SocketError& ex) {
    std::cerr << "[daemon-state] " << ex.what() << '\n';
    throw core::InternalError(core::error_code::kSocketConnect);
  }

  try {
    connection->send(request.command);
  } catch (const transport::SocketError& ex) {
    std::cerr << "[daemon-state] " << request.socket_path.string() << ": " << ex.what() << '\n';
    throw core::InternalError(core::error_code::kSocketCommunication, ex.what());
  }

  std::string response;
  try {
    response = connection->receive();
  } catch (const transport::SocketError& ex) {
    std::cerr << "[daemon-state] " << request.socket_path.string() << ": " << ex.what() << '\n';
    throw core::InternalError(core::error_code::kSocketReceive, "Data could not be received");
  }

  connection->close();
  return response;
}

}  // namespace wazuh_stats::daemon
