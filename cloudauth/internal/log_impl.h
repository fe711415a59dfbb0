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

#ifndef CLOUDAUTH_INTERNAL_LOG_IMPL_H
#define CLOUDAUTH_INTERNAL_LOG_IMPL_H

#include "cloudauth/log.h"
#include "cloudauth/version.h"
#include <mutex>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Writes records at or above a minimum severity to `std::clog`.
class StdClogBackend : public LogBackend {
 public:
  explicit StdClogBackend(Severity min_severity)
      : min_severity_(min_severity) {}

  void Process(LogRecord const& lr) override;

 private:
  std::mutex mu_;
  Severity min_severity_;
};

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_LOG_IMPL_H
