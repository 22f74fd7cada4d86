#include "transport/unix_socket.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace wazuh_stats::transport {
namespace {

std::string errno_message(const std::string& what, const int error) { return what + ": " + std::strerror(error); }

}  // namespace

std::string encode_frame(const std::string& payload) {
  const auto size = static_cast<std::uint32_t>(payload.size());
  std::string frame;
  frame.reserve(kFrameHeaderSize + payload.size());
  frame.push_back(static_cast<char>(size & 0xFFU));
  frame.push_back(static_cast<char>((size >> 8U) & 0xFFU));
  frame.push_back(static_cast<char>((size >> 16U) & 0xFFU));
  frame.push_back(static_cast<char>((size >> 24U) & 0xFFU));
  frame += payload;
  return frame;
}

std::uint32_t decode_frame_header(const unsigned char (&header)[kFrameHeaderSize]) noexcept {
  return static_cast<std::uint32_t>(header[0]) | (static_cast<std::uint32_t>(header[1]) << 8U) |
         (static_cast<std::uint32_t>(header[2]) << 16U) | (static_cast<std::uint32_t>(header[3]) << 24U);
}

UnixSocketConnection::UnixSocketConnection(const int fd, UnixSocketOptions options)
    : fd_(fd), options_(std::move(options)) {}

UnixSocketConnection::~UnixSocketConnection() { close(); }

void UnixSocketConnection::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void UnixSocketConnection::send(const std::string& payload) {
  if (fd_ < 0) {
    throw SocketError("send on closed socket");
  }
  if (payload.size() > options_.max_message_size) {
    throw SocketError("message of " + std::to_string(payload.size()) + " bytes exceeds limit");
  }

  const std::string frame = encode_frame(payload);
  std::size_t sent = 0;
  while (sent < frame.size()) {
    const ssize_t result = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw SocketError(errno_message("send failed", errno));
    }
    sent += static_cast<std::size_t>(result);
  }
}

std::string UnixSocketConnection::receive() {
  if (fd_ < 0) {
    throw SocketError("receive on closed socket");
  }

  unsigned char header[kFrameHeaderSize]{};
  read_exact(reinterpret_cast<char*>(header), sizeof(header));

  const std::uint32_t size = decode_frame_header(header);
  if (size == 0U || size > options_.max_message_size) {
    throw SocketError("invalid frame length " + std::to_string(size));
  }

  std::string payload(size, '\0');
  read_exact(payload.data(), payload.size());
  return payload;
}

void UnixSocketConnection::read_exact(char* buffer, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t result = ::recv(fd_, buffer + received, size - received, MSG_WAITALL);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw SocketError("receive timed out");
      }
      throw SocketError(errno_message("receive failed", errno));
    }
    if (result == 0) {
      throw SocketError("peer closed connection");
    }
    received += static_cast<std::size_t>(result);
  }
}

UnixSocketTransport::UnixSocketTransport(UnixSocketOptions options) : options_(std::move(options)) {}

std::unique_ptr<SocketConnection> UnixSocketTransport::open(const std::filesystem::path& path) {
  const std::string target = path.string();
  sockaddr_un address{};
  address.sun_family = AF_UNIX;
  if (target.empty() || target.size() >= sizeof(address.sun_path)) {
    throw SocketError("invalid socket path: " + target);
  }
  std::memcpy(address.sun_path, target.c_str(), target.size() + 1);

  const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    throw SocketError(errno_message("socket failed", errno));
  }
  // Owns fd from here so every throw below closes it.
  auto connection = std::make_unique<UnixSocketConnection>(fd, options_);

  if (options_.receive_timeout.count() > 0) {
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(options_.receive_timeout.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((options_.receive_timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
      throw SocketError(errno_message("setsockopt SO_RCVTIMEO failed", errno));
    }
  }

  if (::connect(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
    const int connect_errno = errno;
    throw SocketError(errno_message("connect to " + target + " failed", connect_errno));
  }

  return connection;
}

}  // namespace wazuh_stats::transport
