#include "strata/transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "strata/observability.hpp"

namespace strata {

bool parse_endpoint(const std::string& endpoint, std::string& host, uint16_t& port) {
  const auto colon = endpoint.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= endpoint.size()) return false;
  unsigned long p = 0;
  for (size_t i = colon + 1; i < endpoint.size(); ++i) {
    const char c = endpoint[i];
    if (c < '0' || c > '9') return false;
    p = p * 10 + static_cast<unsigned long>(c - '0');
    if (p > 65535) return false;
  }
  if (p == 0) return false;
  host = endpoint.substr(0, colon);
  port = static_cast<uint16_t>(p);
  return true;
}

TcpTransport::TcpTransport(std::string host, uint16_t port, std::size_t max_frame_size)
    : host_(std::move(host)), port_(port), max_frame_size_(max_frame_size) {}

TcpTransport::~TcpTransport() {
  close();
}

std::string TcpTransport::endpoint() const {
  return host_ + ":" + std::to_string(port_);
}

bool TcpTransport::open() {
  if (fd_ >= 0) return true;
  read_buffer_.clear();
  write_buffer_.clear();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(port_);
  const int gai = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
  if (gai != 0 || !res) {
    last_error_ = std::string("getaddrinfo() failed: ") + gai_strerror(gai);
    return false;
  }

  fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (fd_ < 0) {
    last_error_ = std::string("socket() failed: ") + std::strerror(errno);
    ::freeaddrinfo(res);
    return false;
  }

  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags >= 0) ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
  int one = 1;
  ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  const int rc = ::connect(fd_, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);
  if (rc == 0) {
    open_ = true;
    connecting_ = false;
    announce_open_ = true;
    return true;
  }
  if (errno != EINPROGRESS) {
    last_error_ = std::string("connect() failed: ") + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  connecting_ = true;
  return true;
}

bool TcpTransport::send(const std::string& frame) {
  if (!open_) return false;
  write_buffer_ += frame;
  write_buffer_ += '\n';
  return true;
}

void TcpTransport::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  connecting_ = false;
  open_ = false;
  announce_open_ = false;
  read_buffer_.clear();
  write_buffer_.clear();
}

void TcpTransport::fail(std::vector<TransportEvent>& events, const std::string& why) {
  last_error_ = why;
  const bool was_open = open_;
  close();
  events.push_back({was_open ? TransportEventKind::closed : TransportEventKind::error, why});
}

void TcpTransport::drain_frames(std::vector<TransportEvent>& events) {
  size_t pos;
  while ((pos = read_buffer_.find('\n')) != std::string::npos) {
    std::string line = read_buffer_.substr(0, pos);
    read_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) events.push_back({TransportEventKind::message, std::move(line)});
  }
}

void TcpTransport::flush_writes(std::vector<TransportEvent>& events) {
  while (!write_buffer_.empty()) {
    const ssize_t n = ::send(fd_, write_buffer_.data(), write_buffer_.size(), MSG_NOSIGNAL);
    if (n > 0) {
      write_buffer_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (n < 0 && errno == EINTR) continue;
    fail(events, std::string("send() failed: ") + std::strerror(errno));
    return;
  }
}

std::vector<TransportEvent> TcpTransport::poll(int timeout_ms) {
  std::vector<TransportEvent> events;
  if (fd_ < 0) return events;

  // A synchronous connect() reports opened on the first poll.
  if (announce_open_) {
    announce_open_ = false;
    events.push_back({TransportEventKind::opened, endpoint()});
    return events;
  }

  short want = POLLIN;
  if (connecting_ || !write_buffer_.empty()) want |= POLLOUT;
  pollfd pfd{fd_, want, 0};
  const int ret = ::poll(&pfd, 1, timeout_ms);
  if (ret < 0) {
    if (errno != EINTR) {
      log(LogLevel::warn, "transport", std::string("poll() error: ") + std::strerror(errno));
    }
    return events;
  }
  if (ret == 0) return events;

  if (connecting_) {
    if (pfd.revents & (POLLOUT | POLLERR | POLLHUP)) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        fail(events, std::string("connect() failed: ") + std::strerror(so_error));
        return events;
      }
      connecting_ = false;
      open_ = true;
      events.push_back({TransportEventKind::opened, endpoint()});
    }
    return events;
  }

  if (pfd.revents & POLLIN) {
    char buf[4096];
    while (true) {
      const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n > 0) {
        read_buffer_.append(buf, static_cast<size_t>(n));
        drain_frames(events);
        if (read_buffer_.size() > max_frame_size_) {
          fail(events, "inbound frame too large");
          return events;
        }
        continue;
      }
      if (n == 0) {
        // Complete frames that arrived before the close were drained above.
        fail(events, "connection closed by peer");
        return events;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      if (errno == EINTR) continue;
      fail(events, std::string("recv() failed: ") + std::strerror(errno));
      return events;
    }
  }

  if (pfd.revents & (POLLERR | POLLNVAL)) {
    fail(events, "socket error");
    return events;
  }
  if ((pfd.revents & POLLHUP) && !(pfd.revents & POLLIN)) {
    fail(events, "connection closed by peer");
    return events;
  }

  if (open_ && !write_buffer_.empty()) flush_writes(events);
  return events;
}

}  // namespace strata
