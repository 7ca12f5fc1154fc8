#pragma once

#include "heos/codec.h"
#include "heos/config.h"
#include "heos/session_pool.h"
#include "heos/types.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace heos {

/**
 * Sends commands to devices over pooled sessions.
 *
 * Safe for concurrent use; commands to the same device never interleave on
 * one session because sessions are checked out exclusively.
 */
class Dispatcher {
 public:
  /// Notified after every successful command, outside all locks.
  using HistoryCallback = std::function<void(const std::string& command,
                                             const DeviceDescriptor& device,
                                             const Response& response)>;

  /// The pool must outlive the dispatcher.
  Dispatcher(const Config& config, SessionPool* pool);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * Send one command and wait for its reply.
   *
   * Transport failures close the session and are retried up to retry_count
   * times. Protocol errors and device-level failures (kCommandFailed) are not
   * retried.
   *
   * @return true when the device answered with result=success.
   */
  bool SendCommand(const DeviceDescriptor& device,
                   const std::string& command,
                   const Params& params,
                   std::chrono::milliseconds timeout,
                   int retry_count,
                   Response* response,
                   Error* error);

  /// SendCommand with the configured timeout and retry count.
  bool SendCommand(const DeviceDescriptor& device,
                   const std::string& command,
                   const Params& params,
                   Response* response,
                   Error* error);

  void SetHistoryCallback(HistoryCallback cb);

  DispatchMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace heos
