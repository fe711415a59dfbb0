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

#ifndef CLOUDAUTH_TESTING_UTIL_SCOPED_LOG_H
#define CLOUDAUTH_TESTING_UTIL_SCOPED_LOG_H

#include "cloudauth/log.h"
#include "cloudauth/version.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

/**
 * Captures log lines within the current scope.
 *
 * @par Example
 * @code
 * TEST(Foo, Bar) {
 *   ScopedLog log;
 *   ... call code that should log
 *   EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("Refreshing")));
 * }
 * @endcode
 */
class ScopedLog {
 public:
  ScopedLog();
  ~ScopedLog();

  ScopedLog(ScopedLog const&) = delete;
  ScopedLog& operator=(ScopedLog const&) = delete;

  /// Returns the lines captured so far and clears them.
  std::vector<std::string> ExtractLines() { return backend_->ExtractLines(); }

 private:
  class Backend : public LogBackend {
   public:
    std::vector<std::string> ExtractLines();
    void Process(LogRecord const& log_record) override;

   private:
    std::mutex mu_;
    std::vector<std::string> lines_;
  };

  std::shared_ptr<Backend> backend_;
  LogSink::BackendId id_;
  Severity previous_minimum_;
};

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_TESTING_UTIL_SCOPED_LOG_H
