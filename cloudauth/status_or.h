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

#ifndef CLOUDAUTH_STATUS_OR_H
#define CLOUDAUTH_STATUS_OR_H

#include "cloudauth/internal/throw_delegate.h"
#include "cloudauth/status.h"
#include "cloudauth/version.h"
#include "absl/types/variant.h"
#include <type_traits>
#include <utility>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * Either a `T` or the (non-OK) `Status` explaining why there is no `T`.
 *
 * Check it with `ok()` or the `bool` conversion, then dereference it like an
 * optional:
 *
 * @code
 * StatusOr<std::string> token = JwtEncode(signer, payload);
 * if (!token) return std::move(token).status();
 * UseToken(*token);
 * @endcode
 */
template <typename T>
class StatusOr final {
 public:
  using value_type = T;

  /// Holds `StatusCode::kUnknown`, mocks need default-constructible results.
  StatusOr() : v_(Status(StatusCode::kUnknown, "default")) {}

  /**
   * Holds the error @p status.
   *
   * @throws std::invalid_argument if @p status is OK, there would be neither
   *     a value nor an error.
   */
  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(Status status) : v_(std::move(status)) {
    if (absl::get<Status>(v_).ok()) internal::ThrowInvalidArgument(__func__);
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(T value) : v_(std::move(value)) {}

  StatusOr& operator=(Status status) {
    return *this = StatusOr(std::move(status));
  }

  template <typename U = T>
  typename std::enable_if<  // NOLINT(misc-unconventional-assign-operator)
      !std::is_same<StatusOr, typename std::decay<U>::type>::value &&
          !std::is_same<Status, typename std::decay<U>::type>::value,
      StatusOr>::type&
  operator=(U&& u) {
    v_.template emplace<T>(std::forward<U>(u));
    return *this;
  }

  bool ok() const { return absl::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  /// Undefined behavior unless `ok()`.
  T& operator*() & { return absl::get<T>(v_); }
  T const& operator*() const& { return absl::get<T>(v_); }
  T&& operator*() && { return absl::get<T>(std::move(v_)); }

  T* operator->() { return &absl::get<T>(v_); }
  T const* operator->() const { return &absl::get<T>(v_); }

  /// Throws `RuntimeStatusError` unless `ok()`.
  T& value() & {
    if (!ok()) internal::ThrowStatus(status());
    return **this;
  }
  T const& value() const& {
    if (!ok()) internal::ThrowStatus(status());
    return **this;
  }

  Status const& status() const& {
    static auto const* const kOk = new Status;
    return ok() ? *kOk : absl::get<Status>(v_);
  }
  Status status() && {
    if (ok()) return Status{};
    return absl::get<Status>(std::move(v_));
  }

 private:
  absl::variant<Status, T> v_;
};

template <typename T>
bool operator==(StatusOr<T> const& a, StatusOr<T> const& b) {
  if (a.ok() && b.ok()) return *a == *b;
  return a.status() == b.status();
}

template <typename T>
bool operator!=(StatusOr<T> const& a, StatusOr<T> const& b) {
  return !(a == b);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_STATUS_OR_H
