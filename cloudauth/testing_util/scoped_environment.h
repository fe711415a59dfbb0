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

#ifndef CLOUDAUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H
#define CLOUDAUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H

#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

/**
 * Sets (or unsets) an environment variable, and restores it on destruction.
 *
 * The credential resolver reads several environment variables, tests use
 * this to control them without leaking changes to other tests.
 */
class ScopedEnvironment {
 public:
  /// Sets @p variable to @p value, or unsets it if @p value is empty.
  ScopedEnvironment(std::string variable,
                    absl::optional<std::string> const& value);
  ~ScopedEnvironment();

  ScopedEnvironment(ScopedEnvironment const&) = delete;
  ScopedEnvironment& operator=(ScopedEnvironment const&) = delete;

 private:
  std::string variable_;
  absl::optional<std::string> previous_;
};

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_TESTING_UTIL_SCOPED_ENVIRONMENT_H
