#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "transport/socket_transport.hpp"

namespace wazuh_stats::daemon {

// Result of decoding one daemon reply. A reply is either a JSON document with
// an object "data" member, or an error envelope "<status> <message>".
struct DaemonReply {
  bool ok{false};
  nlohmann::json data{};
  std::string error_message{};
};

// last_keepalive and last_ack in `data` are rewritten from the daemon layout
// into `date_format`. A reply whose data or timestamps do not decode is
// treated as an error envelope; an envelope without a space is all message.
DaemonReply decode_daemon_reply(const std::string& raw, const std::string& date_format);

struct DaemonRequest {
  std::filesystem::path socket_path;
  std::string command;
};

class DaemonStatsClient {
 public:
  DaemonStatsClient(core::StatsConfig config, std::shared_ptr<transport::SocketTransport> transport);

  // Validates arguments and picks the socket and command for the target.
  // Throws core::StatsError for empty arguments or the manager's own agent daemon.
  DaemonRequest build_request(const std::string& agent_id, const std::string& daemon) const;

  // Live state of `daemon` on `agent_id` ("000" is the manager). One send,
  // one framed receive, no retries. Throws core::InternalError on transport
  // failures and core::StatsError when the daemon answers with an error.
  nlohmann::json get_daemon_state(const std::string& agent_id, const std::string& daemon) const;

 private:
  std::string exchange(const DaemonRequest& request) const;

  core::StatsConfig config_;
  std::shared_ptr<transport::SocketTransport> transport_;
};

}  // namespace wazuh_stats::daemon
