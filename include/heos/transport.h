#pragma once

#include "heos/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace heos {

/**
 * TCP keep-alive parameters for CLI sessions.
 */
struct KeepAliveOptions {
  bool enabled = true;
  std::chrono::seconds idle{60};
  std::chrono::seconds interval{10};
  int count = 3;
};

/**
 * Line-oriented byte stream to one device.
 *
 * Implementations are not thread-safe; a connection is used by one caller at a
 * time (the session pool checks sessions out exclusively).
 */
class Connection {
 public:
  virtual ~Connection() = default;

  /**
   * Write the whole line (the caller supplies the terminator).
   */
  virtual bool SendLine(const std::string& line,
                        std::chrono::milliseconds timeout,
                        Error* error) = 0;

  /**
   * Read one CRLF-terminated line, without the terminator.
   *
   * When the deadline passes with bytes buffered, returns them if
   * allow_partial is set, otherwise fails with kReadTimeout. With nothing
   * buffered a timeout always fails.
   */
  virtual bool ReceiveLine(std::chrono::milliseconds timeout,
                           bool allow_partial,
                           std::string* line,
                           Error* error) = 0;

  /// Idempotent.
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

/**
 * POSIX TCP implementation of Connection.
 */
class TcpConnection : public Connection {
 public:
  ~TcpConnection() override;

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  /**
   * Connect with a poll-bounded timeout. The socket is closed on any failure.
   *
   * @return nullptr on failure with error filled (kConnectTimeout,
   *         kConnectRefused, kConnectFailed or kInvalidArgument).
   */
  static std::unique_ptr<TcpConnection> Connect(const std::string& address,
                                                uint16_t port,
                                                std::chrono::milliseconds timeout,
                                                const KeepAliveOptions& keep_alive,
                                                Error* error);

  bool SendLine(const std::string& line,
                std::chrono::milliseconds timeout,
                Error* error) override;
  bool ReceiveLine(std::chrono::milliseconds timeout,
                   bool allow_partial,
                   std::string* line,
                   Error* error) override;
  void Close() override;
  bool IsOpen() const override;

  /// False when the kernel refused one of the keep-alive options.
  bool keep_alive_applied() const { return keep_alive_applied_; }

 private:
  TcpConnection(int fd, std::string peer);

  int fd_ = -1;
  std::string peer_;
  std::string buffer_;
  bool keep_alive_applied_ = false;
};

/**
 * Factory used by the session pool to open connections.
 */
using Connector = std::function<std::unique_ptr<Connection>(
    const std::string& address,
    uint16_t port,
    std::chrono::milliseconds timeout,
    Error* error)>;

/// Connector producing TcpConnection instances.
Connector MakeTcpConnector(const KeepAliveOptions& keep_alive);

/**
 * Try connecting up to attempts times. The backoff doubles after each failed
 * attempt; the final error carries the last underlying cause.
 */
std::unique_ptr<Connection> ConnectWithRetry(const Connector& connector,
                                             const std::string& address,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout,
                                             int attempts,
                                             std::chrono::milliseconds backoff,
                                             Error* error);

/**
 * Open and immediately close a TCP connection.
 */
bool ProbeReachable(const std::string& address,
                    uint16_t port,
                    std::chrono::milliseconds timeout);

/// Upper bound for one received line.
constexpr size_t kMaxLineBytes = 1024 * 1024;

}  // namespace heos
