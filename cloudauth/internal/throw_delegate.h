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

#ifndef CLOUDAUTH_INTERNAL_THROW_DELEGATE_H
#define CLOUDAUTH_INTERNAL_THROW_DELEGATE_H

#include "cloudauth/version.h"

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
class Status;
namespace internal {

/// Throws `std::invalid_argument`, out of line so templates stay small.
[[noreturn]] void ThrowInvalidArgument(char const* msg);

/// Throws `RuntimeStatusError` wrapping @p status.
[[noreturn]] void ThrowStatus(Status status);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_THROW_DELEGATE_H
