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

#include "cloudauth/internal/setenv.h"
// _putenv_s() on WIN32 and setenv()/unsetenv() on Posix are not guaranteed to
// be declared by <cstdlib>.
#include <stdlib.h>  // NOLINT(modernize-deprecated-headers)

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

void UnsetEnv(char const* variable) {
#ifdef _WIN32
  (void)_putenv_s(variable, "");
#else
  unsetenv(variable);
#endif  // _WIN32
}

void SetEnv(char const* variable, absl::optional<std::string> const& value) {
  if (!value.has_value()) {
    UnsetEnv(variable);
    return;
  }
#ifdef _WIN32
  (void)_putenv_s(variable, value->c_str());
#else
  (void)setenv(variable, value->c_str(), 1);
#endif  // _WIN32
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
