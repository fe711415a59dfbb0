// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CLOUDAUTH_LOG_H
#define CLOUDAUTH_LOG_H

/**
 * @file
 *
 * Logging for `cloudauth`.
 *
 * Library code logs with `CLOUDAUTH_LOG(level) << ...`. Records go to the
 * backends registered in `LogSink::Instance()`. With no backends, or below the
 * sink's minimum severity, the streamed expressions are not evaluated. Setting
 * the `CLOUDAUTH_ENABLE_CLOG` environment variable installs a backend that
 * writes to `std::clog`; its value may name the minimum severity, e.g.
 * `CLOUDAUTH_ENABLE_CLOG=INFO`.
 *
 * Access tokens, refresh tokens, and private keys are never logged.
 */

#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

/// Logs to @p sink, for tests that use their own `LogSink`.
#define CLOUDAUTH_LOG_I(level, sink)                                      \
  for (::cloudauth::internal::LogMessage cloudauth_log_message(           \
           ::cloudauth::Severity::level, __func__, __FILE__, __LINE__,    \
           sink);                                                         \
       cloudauth_log_message.enabled(); cloudauth_log_message.Send())     \
  cloudauth_log_message.stream()

/// Logs a message, e.g. `CLOUDAUTH_LOG(INFO) << "refreshing credentials";`.
#define CLOUDAUTH_LOG(level) \
  CLOUDAUTH_LOG_I(CLOUDAUTH_LS_##level, ::cloudauth::LogSink::Instance())

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

enum class Severity : int {
  /// Entering and leaving functions.
  CLOUDAUTH_LS_TRACE,  // NOLINT(readability-identifier-naming)
  /// Each step of the default credentials chain, failed metadata pings.
  CLOUDAUTH_LS_DEBUG,  // NOLINT(readability-identifier-naming)
  /// Normal progress, e.g. refreshing credentials after a 401.
  CLOUDAUTH_LS_INFO,  // NOLINT(readability-identifier-naming)
  /// Problems the application may need to act on.
  CLOUDAUTH_LS_WARNING,  // NOLINT(readability-identifier-naming)
  CLOUDAUTH_LS_ERROR,    // NOLINT(readability-identifier-naming)
  // NOLINTNEXTLINE(readability-identifier-naming)
  CLOUDAUTH_LS_LOWEST = CLOUDAUTH_LS_TRACE,
  // NOLINTNEXTLINE(readability-identifier-naming)
  CLOUDAUTH_LS_HIGHEST = CLOUDAUTH_LS_ERROR,
};

/// Converts a name such as "INFO" or "WARNING" to a `Severity`.
absl::optional<Severity> ParseSeverity(std::string const& name);

std::ostream& operator<<(std::ostream& os, Severity x);

struct LogRecord {
  Severity severity;
  std::string function;
  std::string filename;
  int lineno;
  std::thread::id thread_id;
  std::chrono::system_clock::time_point timestamp;
  std::string message;
};

/// Formats as `timestamp [SEVERITY] <thread> message (file:line)`.
std::ostream& operator<<(std::ostream& os, LogRecord const& rhs);

class LogBackend {
 public:
  virtual ~LogBackend() = default;
  virtual void Process(LogRecord const& log_record) = 0;
};

/**
 * Dispatches log records to a set of backends.
 *
 * `empty()` and `is_enabled()` are lock-free, every `CLOUDAUTH_LOG()` checks
 * them. A record logged while a backend is added or removed may miss it.
 */
class LogSink {
 public:
  using BackendId = long;  // NOLINT(google-runtime-int)

  LogSink() = default;

  /// The process-wide sink used by `CLOUDAUTH_LOG()`.
  static LogSink& Instance();

  bool empty() const { return empty_.load(std::memory_order_relaxed); }

  bool is_enabled(Severity severity) const {
    return static_cast<int>(severity) >=
           minimum_severity_.load(std::memory_order_relaxed);
  }

  Severity minimum_severity() const {
    return static_cast<Severity>(minimum_severity_.load());
  }
  void set_minimum_severity(Severity minimum) {
    minimum_severity_.store(static_cast<int>(minimum));
  }

  BackendId AddBackend(std::shared_ptr<LogBackend> backend);
  void RemoveBackend(BackendId id);

  void Log(LogRecord const& log_record);

 private:
  std::atomic<bool> empty_{true};
  std::atomic<int> minimum_severity_{
      static_cast<int>(Severity::CLOUDAUTH_LS_LOWEST)};
  std::mutex mu_;
  BackendId next_id_ = 0;
  std::map<BackendId, std::shared_ptr<LogBackend>> backends_;
};

namespace internal {

/// Collects one `CLOUDAUTH_LOG()` message and sends it to the sink.
class LogMessage {
 public:
  LogMessage(Severity severity, char const* function, char const* filename,
             int lineno, LogSink& sink)
      : sink_(sink),
        enabled_(!sink.empty() && sink.is_enabled(severity)),
        severity_(severity),
        function_(function),
        filename_(filename),
        lineno_(lineno) {}

  bool enabled() const { return enabled_; }
  std::ostream& stream() {
    if (!stream_) stream_.reset(new std::ostringstream);
    return *stream_;
  }
  void Send();

 private:
  LogSink& sink_;
  bool enabled_;
  Severity severity_;
  char const* function_;
  char const* filename_;
  int lineno_;
  std::unique_ptr<std::ostringstream> stream_;
};

/// Returns the backend configured by `CLOUDAUTH_ENABLE_CLOG`, or null.
std::shared_ptr<LogBackend> DefaultLogBackend();

}  // namespace internal

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_LOG_H
