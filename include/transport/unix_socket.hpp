#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "transport/socket_transport.hpp"

namespace wazuh_stats::transport {

struct UnixSocketOptions {
  std::chrono::milliseconds receive_timeout{0};
  std::size_t max_message_size{65536};
};

// Frame layout: 4-byte little-endian payload length, then the payload.
constexpr std::size_t kFrameHeaderSize = 4;

std::string encode_frame(const std::string& payload);
std::uint32_t decode_frame_header(const unsigned char (&header)[kFrameHeaderSize]) noexcept;

class UnixSocketConnection final : public SocketConnection {
 public:
  UnixSocketConnection(int fd, UnixSocketOptions options);
  ~UnixSocketConnection() override;

  UnixSocketConnection(const UnixSocketConnection&) = delete;
  UnixSocketConnection& operator=(const UnixSocketConnection&) = delete;

  void send(const std::string& payload) override;
  std::string receive() override;
  void close() noexcept override;

 private:
  void read_exact(char* buffer, std::size_t size);

  int fd_{-1};
  UnixSocketOptions options_;
};

// AF_UNIX stream sockets used by the local daemons.
class UnixSocketTransport final : public SocketTransport {
 public:
  explicit UnixSocketTransport(UnixSocketOptions options = {});

  std::unique_ptr<SocketConnection> open(const std::filesystem::path& path) override;

 private:
  UnixSocketOptions options_;
};

}  // namespace wazuh_stats::transport
