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

#include "cloudauth/testing_util/scoped_log.h"
#include "absl/strings/str_split.h"

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

ScopedLog::ScopedLog()
    : backend_(std::make_shared<Backend>()),
      id_(LogSink::Instance().AddBackend(backend_)),
      previous_minimum_(LogSink::Instance().minimum_severity()) {
  LogSink::Instance().set_minimum_severity(Severity::CLOUDAUTH_LS_LOWEST);
}

ScopedLog::~ScopedLog() {
  LogSink::Instance().RemoveBackend(id_);
  LogSink::Instance().set_minimum_severity(previous_minimum_);
}

std::vector<std::string> ScopedLog::Backend::ExtractLines() {
  std::vector<std::string> result;
  std::lock_guard<std::mutex> lk(mu_);
  result.swap(lines_);
  return result;
}

void ScopedLog::Backend::Process(LogRecord const& log_record) {
  std::vector<std::string> lines = absl::StrSplit(log_record.message, '\n');
  std::lock_guard<std::mutex> lk(mu_);
  lines_.insert(lines_.end(), lines.begin(), lines.end());
}

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
