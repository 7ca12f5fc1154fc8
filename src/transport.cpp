#include "heos/transport.h"

#include "log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace heos {
namespace {

using internal::Fail;

void CloseRetry(int fd) {
  if (fd < 0) {
    return;
  }
  int rc = 0;
  do {
    rc = ::close(fd);
  } while (rc < 0 && errno == EINTR);
}

int ToPollTimeout(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return 0;
  }
  constexpr int64_t kMaxPoll = 24 * 60 * 60 * 1000;
  return static_cast<int>(std::min<int64_t>(timeout.count(), kMaxPoll));
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::string Endpoint(const std::string& address, uint16_t port) {
  std::ostringstream oss;
  oss << address << ":" << port;
  return oss.str();
}

ErrorKind ConnectErrorKind(int err) {
  switch (err) {
    case ETIMEDOUT:
      return ErrorKind::kConnectTimeout;
    case ECONNREFUSED:
      return ErrorKind::kConnectRefused;
    default:
      return ErrorKind::kConnectFailed;
  }
}

bool SetCloseOnExec(int fd) {
  const int flags = ::fcntl(fd, F_GETFD);
  return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool ApplyKeepAlive(int fd, const KeepAliveOptions& options) {
  int yes = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &yes, sizeof(yes)) != 0) {
    return false;
  }
  bool applied = true;
#ifdef TCP_KEEPIDLE
  int idle = static_cast<int>(options.idle.count());
  applied &= ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) == 0;
#endif
#ifdef TCP_KEEPINTVL
  int interval = static_cast<int>(options.interval.count());
  applied &= ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval,
                          sizeof(interval)) == 0;
#endif
#ifdef TCP_KEEPCNT
  int count = options.count;
  applied &= ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) == 0;
#endif
  return applied;
}

// Non-blocking connect bounded by poll. Returns 0 or the errno that failed it.
int ConnectWithTimeout(int fd, const sockaddr_in& addr,
                       std::chrono::milliseconds timeout) {
  int rc = 0;
  do {
    rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  } while (rc != 0 && errno == EINTR);
  if (rc == 0) {
    return 0;
  }
  if (errno != EINPROGRESS) {
    return errno;
  }
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLOUT;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int prc = 0;
  do {
    prc = ::poll(&pfd, 1, ToPollTimeout(Remaining(deadline)));
  } while (prc < 0 && errno == EINTR);
  if (prc == 0) {
    return ETIMEDOUT;
  }
  if (prc < 0) {
    return errno;
  }
  int soerr = 0;
  socklen_t len = sizeof(soerr);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) != 0) {
    return errno;
  }
  return soerr;
}

// Opens a connected, non-blocking socket or returns -1 with error filled.
int OpenSocket(const std::string& address, uint16_t port,
               std::chrono::milliseconds timeout, Error* error) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (port == 0 || ::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    Fail(error, ErrorKind::kInvalidArgument,
         "invalid device address " + Endpoint(address, port));
    return -1;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    Fail(error, ErrorKind::kConnectFailed,
         "socket() failed: " + std::string(std::strerror(errno)));
    return -1;
  }
  if (!SetCloseOnExec(fd) || !SetNonBlocking(fd)) {
    const int err = errno;
    CloseRetry(fd);
    Fail(error, ErrorKind::kConnectFailed,
         "fcntl() failed: " + std::string(std::strerror(err)));
    return -1;
  }
  const int err = ConnectWithTimeout(fd, addr, timeout);
  if (err != 0) {
    CloseRetry(fd);
    const ErrorKind kind = ConnectErrorKind(err);
    std::string message = "connect to " + Endpoint(address, port);
    if (kind == ErrorKind::kConnectTimeout) {
      message += " timed out";
    } else {
      message += " failed: " + std::string(std::strerror(err));
    }
    Fail(error, kind, message);
    return -1;
  }
  return fd;
}

}  // namespace

TcpConnection::TcpConnection(int fd, std::string peer)
    : fd_(fd), peer_(std::move(peer)) {}

TcpConnection::~TcpConnection() { Close(); }

std::unique_ptr<TcpConnection> TcpConnection::Connect(
    const std::string& address,
    uint16_t port,
    std::chrono::milliseconds timeout,
    const KeepAliveOptions& keep_alive,
    Error* error) {
  const int fd = OpenSocket(address, port, timeout, error);
  if (fd < 0) {
    return nullptr;
  }
  int yes = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) != 0) {
    const int err = errno;
    CloseRetry(fd);
    Fail(error, ErrorKind::kConnectFailed,
         "setsockopt(TCP_NODELAY) failed: " + std::string(std::strerror(err)));
    return nullptr;
  }
  std::unique_ptr<TcpConnection> connection(
      new TcpConnection(fd, Endpoint(address, port)));
  if (keep_alive.enabled) {
    connection->keep_alive_applied_ = ApplyKeepAlive(fd, keep_alive);
  }
  return connection;
}

bool TcpConnection::SendLine(const std::string& line,
                             std::chrono::milliseconds timeout,
                             Error* error) {
  if (fd_ < 0) {
    return Fail(error, ErrorKind::kConnectionLost, "connection to " + peer_ + " is closed");
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  size_t offset = 0;
  while (offset < line.size()) {
    const ssize_t n = ::send(fd_, line.data() + offset, line.size() - offset,
                             MSG_NOSIGNAL);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      const int err = errno;
      Close();
      return Fail(error, ErrorKind::kConnectionLost,
                  "send to " + peer_ + " failed: " + std::strerror(err));
    }
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    int prc = 0;
    do {
      prc = ::poll(&pfd, 1, ToPollTimeout(Remaining(deadline)));
    } while (prc < 0 && errno == EINTR);
    if (prc == 0) {
      return Fail(error, ErrorKind::kReadTimeout, "send to " + peer_ + " timed out");
    }
    if (prc < 0 || (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
      Close();
      return Fail(error, ErrorKind::kConnectionLost, "connection to " + peer_ + " lost");
    }
  }
  return true;
}

bool TcpConnection::ReceiveLine(std::chrono::milliseconds timeout,
                                bool allow_partial,
                                std::string* line,
                                Error* error) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char chunk[4096];
  for (;;) {
    const size_t pos = buffer_.find(kLineTerminator);
    if (pos != std::string::npos) {
      if (line) {
        *line = buffer_.substr(0, pos);
      }
      buffer_.erase(0, pos + 2);
      return true;
    }
    if (buffer_.size() > kMaxLineBytes) {
      buffer_.clear();
      return Fail(error, ErrorKind::kProtocol,
                  "line from " + peer_ + " exceeds maximum length");
    }
    if (fd_ < 0) {
      return Fail(error, ErrorKind::kConnectionLost, "connection to " + peer_ + " is closed");
    }
    const auto left = Remaining(deadline);
    if (left.count() <= 0) {
      break;
    }
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int prc = 0;
    do {
      prc = ::poll(&pfd, 1, ToPollTimeout(left));
    } while (prc < 0 && errno == EINTR);
    if (prc == 0) {
      break;
    }
    if (prc < 0) {
      const int err = errno;
      Close();
      return Fail(error, ErrorKind::kConnectionLost,
                  "poll on " + peer_ + " failed: " + std::strerror(err));
    }
    const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n > 0) {
      buffer_.append(chunk, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue;
    }
    Close();
    return Fail(error, ErrorKind::kConnectionLost,
                "connection closed by " + peer_);
  }
  if (!buffer_.empty() && allow_partial) {
    if (line) {
      *line = buffer_;
    }
    buffer_.clear();
    return true;
  }
  return Fail(error, ErrorKind::kReadTimeout, "no response from " + peer_);
}

void TcpConnection::Close() {
  CloseRetry(fd_);
  fd_ = -1;
}

bool TcpConnection::IsOpen() const { return fd_ >= 0; }

Connector MakeTcpConnector(const KeepAliveOptions& keep_alive) {
  return [keep_alive](const std::string& address, uint16_t port,
                      std::chrono::milliseconds timeout,
                      Error* error) -> std::unique_ptr<Connection> {
    return TcpConnection::Connect(address, port, timeout, keep_alive, error);
  };
}

std::unique_ptr<Connection> ConnectWithRetry(const Connector& connector,
                                             const std::string& address,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout,
                                             int attempts,
                                             std::chrono::milliseconds backoff,
                                             Error* error) {
  if (!connector) {
    Fail(error, ErrorKind::kInvalidArgument, "no connector configured");
    return nullptr;
  }
  Error last;
  auto delay = backoff;
  for (int attempt = 0; attempt < std::max(1, attempts); ++attempt) {
    if (attempt > 0 && delay.count() > 0) {
      std::this_thread::sleep_for(delay);
      delay *= 2;
    }
    last = Error{};
    auto connection = connector(address, port, timeout, &last);
    if (connection) {
      return connection;
    }
    if (last.ok()) {
      last.kind = ErrorKind::kConnectFailed;
      last.message = "connect to " + Endpoint(address, port) + " failed";
    }
    if (last.kind == ErrorKind::kInvalidArgument) {
      break;
    }
  }
  if (error) {
    *error = last;
  }
  return nullptr;
}

bool ProbeReachable(const std::string& address,
                    uint16_t port,
                    std::chrono::milliseconds timeout) {
  const int fd = OpenSocket(address, port, timeout, nullptr);
  if (fd < 0) {
    return false;
  }
  CloseRetry(fd);
  return true;
}

}  // namespace heos
