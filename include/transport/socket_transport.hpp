#pragma once

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace wazuh_stats::transport {

// Raised by transports on connect, send or receive failures.
class SocketError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One open request/response channel. Implementations release the
// underlying handle on destruction if close() was not called.
class SocketConnection {
 public:
  virtual ~SocketConnection() = default;

  virtual void send(const std::string& payload) = 0;

  // Blocks for exactly one framed message.
  virtual std::string receive() = 0;

  virtual void close() noexcept = 0;
};

class SocketTransport {
 public:
  virtual ~SocketTransport() = default;

  virtual std::unique_ptr<SocketConnection> open(const std::filesystem::path& path) = 0;
};

}  // namespace wazuh_stats::transport
