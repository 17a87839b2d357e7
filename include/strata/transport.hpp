#pragma once

// strata/transport.hpp — Duplex frame transport.
//
// The session owns exactly one ITransport and drives it from its owner thread
// through poll(). Implementations never call back into the session; they
// report everything as TransportEvents:
//   opened   connection established (after open())
//   message  one complete inbound frame (newline stripped)
//   closed   the peer or the network ended the connection
//   error    the connection attempt or an established connection failed
//
// open() starts an attempt and returns false only when it fails synchronously.
// A transport can be reopened after close(), closed or error.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace strata {

enum class TransportEventKind { opened, message, closed, error };

struct TransportEvent {
  TransportEventKind kind;
  std::string data;
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual bool open() = 0;
  // Queues one frame. Returns false when the transport is not open.
  virtual bool send(const std::string& frame) = 0;
  virtual void close() = 0;
  virtual std::vector<TransportEvent> poll(int timeout_ms) = 0;
  virtual std::string endpoint() const = 0;
};

// ---------------------------------------------------------------------------
// TcpTransport — NDJSON over a non-blocking TCP socket
// ---------------------------------------------------------------------------
// One frame per line. Writes are buffered and flushed when the socket is
// writable; reads accumulate until a newline ("\r\n" is accepted, empty
// lines are skipped). An unterminated frame longer than max_frame_size closes
// the connection.
class TcpTransport final : public ITransport {
 public:
  static constexpr std::size_t kMaxFrameSize = 16 * 1024 * 1024;

  TcpTransport(std::string host, uint16_t port, std::size_t max_frame_size = kMaxFrameSize);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool open() override;
  bool send(const std::string& frame) override;
  void close() override;
  std::vector<TransportEvent> poll(int timeout_ms) override;
  std::string endpoint() const override;

  const std::string& last_error() const { return last_error_; }

 private:
  void fail(std::vector<TransportEvent>& events, const std::string& why);
  void flush_writes(std::vector<TransportEvent>& events);
  void drain_frames(std::vector<TransportEvent>& events);

  std::string host_;
  uint16_t port_;
  std::size_t max_frame_size_;
  int fd_{-1};
  bool connecting_{false};
  bool open_{false};
  bool announce_open_{false};
  std::string read_buffer_;
  std::string write_buffer_;
  std::string last_error_;
};

// Parses "host:port". Returns false on a malformed endpoint.
bool parse_endpoint(const std::string& endpoint, std::string& host, uint16_t& port);

}  // namespace strata
