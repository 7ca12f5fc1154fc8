#include "heos/dispatcher.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

namespace heos {

struct Dispatcher::Impl {
  struct Metrics {
    std::atomic<uint64_t> commands_sent{0};
    std::atomic<uint64_t> commands_failed{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> history_callback_exceptions{0};
  };

  Impl(const Config& cfg, SessionPool* session_pool) : config(cfg), pool(session_pool) {}

  void NotifyHistory(const std::string& command, const DeviceDescriptor& device,
                     const Response& response) {
    HistoryCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex);
      callback = history_cb;
    }
    if (!callback) {
      return;
    }
    try {
      callback(command, device, response);
    } catch (const std::exception& ex) {
      RecordCallbackException(ex.what());
    } catch (...) {
      RecordCallbackException("unknown exception");
    }
  }

  void RecordCallbackException(const std::string& what) {
    metrics.history_callback_exceptions.fetch_add(1);
    internal::LogError(config, "HistoryCallback threw exception: " + what);
  }

  // Device-level failure text, e.g. "player/get_volume failed: ID Not Valid (eid 2)".
  static std::string DescribeFailure(const std::string& command, const Response& response) {
    std::ostringstream oss;
    oss << command << " failed";
    const auto text = FindField(response.message_fields, "text");
    const auto eid = FindField(response.message_fields, "eid");
    if (text && !text->empty()) {
      oss << ": " << *text;
    } else if (!response.message.empty()) {
      oss << ": " << response.message;
    }
    if (eid && !eid->empty()) {
      oss << " (eid " << *eid << ")";
    }
    return oss.str();
  }

  Config config;
  SessionPool* pool = nullptr;
  std::mutex callback_mutex;
  HistoryCallback history_cb;
  Metrics metrics;
};

Dispatcher::Dispatcher(const Config& config, SessionPool* pool)
    : impl_(new Impl(config, pool)) {}

Dispatcher::~Dispatcher() = default;

bool Dispatcher::SendCommand(const DeviceDescriptor& device,
                             const std::string& command,
                             const Params& params,
                             std::chrono::milliseconds timeout,
                             int retry_count,
                             Response* response,
                             Error* error) {
  impl_->metrics.commands_sent.fetch_add(1);
  Error last;
  if (!ValidateCommand(command, &last)) {
    impl_->metrics.commands_failed.fetch_add(1);
    if (error) {
      *error = last;
    }
    return false;
  }
  if (device.address.empty() || !impl_->pool) {
    impl_->metrics.commands_failed.fetch_add(1);
    return internal::Fail(error, ErrorKind::kInvalidArgument,
                          "no device address for " + command);
  }

  const CommandRequest request{command, params};
  const int attempts = 1 + std::max(0, retry_count);
  for (int attempt = 0; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      impl_->metrics.retries.fetch_add(1);
      internal::LogDebug(impl_->config, "retrying " + command + " on " + device.address +
                                            " after " + internal::Describe(last));
      if (impl_->config.command_retry_delay.count() > 0) {
        std::this_thread::sleep_for(impl_->config.command_retry_delay);
      }
    }
    last = Error{};
    auto session = impl_->pool->EnsureSession(device.address, device.port, &last);
    if (!session) {
      if (IsRetryable(last.kind)) {
        continue;
      }
      break;
    }
    Response reply;
    if (!session->RoundTrip(request, timeout, &reply, &last)) {
      // The session closed itself; dropping it keeps it out of the pool.
      session.reset();
      if (IsRetryable(last.kind)) {
        continue;
      }
      break;
    }
    impl_->pool->StoreSession(std::move(session));
    if (!reply.ok) {
      last = Error{ErrorKind::kCommandFailed, Impl::DescribeFailure(command, reply)};
      if (response) {
        *response = std::move(reply);
      }
      break;
    }
    impl_->NotifyHistory(command, device, reply);
    if (response) {
      *response = std::move(reply);
    }
    return true;
  }

  impl_->metrics.commands_failed.fetch_add(1);
  internal::LogWarning(impl_->config, "command " + command + " to " + device.address +
                                          " failed: " + internal::Describe(last));
  if (error) {
    *error = last;
  }
  return false;
}

bool Dispatcher::SendCommand(const DeviceDescriptor& device,
                             const std::string& command,
                             const Params& params,
                             Response* response,
                             Error* error) {
  return SendCommand(device, command, params, impl_->config.command_timeout,
                     impl_->config.command_retries, response, error);
}

void Dispatcher::SetHistoryCallback(HistoryCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->history_cb = std::move(cb);
}

DispatchMetrics Dispatcher::GetMetrics() const {
  DispatchMetrics out;
  out.commands_sent = impl_->metrics.commands_sent.load();
  out.commands_failed = impl_->metrics.commands_failed.load();
  out.retries = impl_->metrics.retries.load();
  out.history_callback_exceptions = impl_->metrics.history_callback_exceptions.load();
  return out;
}

}  // namespace heos
