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

#include "cloudauth/log.h"
#include "cloudauth/internal/getenv.h"
#include "cloudauth/internal/log_impl.h"
#include "absl/time/time.h"
#include <array>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

std::array<char const*, 5> constexpr kSeverityNames{{
    "TRACE",
    "DEBUG",
    "INFO",
    "WARNING",
    "ERROR",
}};

static_assert(kSeverityNames.size() ==
                  static_cast<std::size_t>(Severity::CLOUDAUTH_LS_HIGHEST) + 1,
              "every Severity needs a name");

}  // namespace

absl::optional<Severity> ParseSeverity(std::string const& name) {
  for (std::size_t i = 0; i != kSeverityNames.size(); ++i) {
    if (name == kSeverityNames[i]) return static_cast<Severity>(i);
  }
  return absl::nullopt;
}

std::ostream& operator<<(std::ostream& os, Severity x) {
  return os << kSeverityNames[static_cast<std::size_t>(x)];
}

std::ostream& operator<<(std::ostream& os, LogRecord const& rhs) {
  auto constexpr kFormat = "%E4Y-%m-%dT%H:%M:%E9SZ";
  return os << absl::FormatTime(kFormat, absl::FromChrono(rhs.timestamp),
                                absl::UTCTimeZone())
            << " [" << rhs.severity << "] <" << rhs.thread_id << "> "
            << rhs.message << " (" << rhs.filename << ':' << rhs.lineno
            << ')';
}

LogSink& LogSink::Instance() {
  static auto* const kInstance = [] {
    auto* sink = new LogSink;
    auto backend = internal::DefaultLogBackend();
    if (backend) sink->AddBackend(std::move(backend));
    return sink;
  }();
  return *kInstance;
}

LogSink::BackendId LogSink::AddBackend(std::shared_ptr<LogBackend> backend) {
  std::lock_guard<std::mutex> lk(mu_);
  auto const id = ++next_id_;
  backends_.emplace(id, std::move(backend));
  empty_.store(false);
  return id;
}

void LogSink::RemoveBackend(BackendId id) {
  std::lock_guard<std::mutex> lk(mu_);
  backends_.erase(id);
  empty_.store(backends_.empty());
}

void LogSink::Log(LogRecord const& log_record) {
  // Backends run without `mu_`, so they may add or remove backends.
  std::map<BackendId, std::shared_ptr<LogBackend>> backends;
  {
    std::lock_guard<std::mutex> lk(mu_);
    backends = backends_;
  }
  for (auto const& kv : backends) kv.second->Process(log_record);
}

namespace internal {

void LogMessage::Send() {
  enabled_ = false;
  if (!stream_) return;
  LogRecord record;
  record.severity = severity_;
  record.function = function_;
  record.filename = filename_;
  record.lineno = lineno_;
  record.thread_id = std::this_thread::get_id();
  record.timestamp = std::chrono::system_clock::now();
  record.message = stream_->str();
  sink_.Log(record);
}

std::shared_ptr<LogBackend> DefaultLogBackend() {
  auto value = GetEnv("CLOUDAUTH_ENABLE_CLOG");
  if (!value) return nullptr;
  return std::make_shared<StdClogBackend>(
      ParseSeverity(*value).value_or(Severity::CLOUDAUTH_LS_LOWEST));
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
