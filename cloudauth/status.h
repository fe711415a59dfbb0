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

#ifndef CLOUDAUTH_STATUS_H
#define CLOUDAUTH_STATUS_H

#include "cloudauth/version.h"
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * The status codes used by this library.
 *
 * The numeric values match `grpc::StatusCode`, so a caller can forward them
 * to gRPC-based clients unchanged.
 */
enum class StatusCode {
  kOk = 0,
  kUnknown = 2,
  kInvalidArgument = 3,
  kDeadlineExceeded = 4,
  kNotFound = 5,
  kPermissionDenied = 7,
  kUnimplemented = 12,
  kInternal = 13,
  kUnavailable = 14,
  kUnauthenticated = 16,
};

/// The UPPER_SNAKE_CASE name of @p code, e.g. `NOT_FOUND`.
std::string StatusCodeToString(StatusCode code);

std::ostream& operator<<(std::ostream& os, StatusCode code);

/**
 * Structured details about an error.
 *
 * The `reason()` identifies the failure category (see
 * `cloudauth/internal/auth_errors.h`), `domain()` is `cloudauth` for errors
 * created by this library, and `metadata()` carries context such as the
 * source location or the HTTP status of a failed refresh.
 *
 * @see https://cloud.google.com/apis/design/errors#error_info
 */
class ErrorInfo {
 public:
  using Metadata = std::unordered_map<std::string, std::string>;

  ErrorInfo() = default;
  ErrorInfo(std::string reason, std::string domain, Metadata metadata)
      : reason_(std::move(reason)),
        domain_(std::move(domain)),
        metadata_(std::move(metadata)) {}

  std::string const& reason() const { return reason_; }
  std::string const& domain() const { return domain_; }
  Metadata const& metadata() const { return metadata_; }

  bool empty() const {
    return reason_.empty() && domain_.empty() && metadata_.empty();
  }

  friend bool operator==(ErrorInfo const& a, ErrorInfo const& b) {
    return a.reason_ == b.reason_ && a.domain_ == b.domain_ &&
           a.metadata_ == b.metadata_;
  }
  friend bool operator!=(ErrorInfo const& a, ErrorInfo const& b) {
    return !(a == b);
  }

 private:
  std::string reason_;
  std::string domain_;
  Metadata metadata_;
};

/**
 * The outcome of an operation: OK, or an error code with a message and
 * `ErrorInfo`.
 *
 * An OK status carries no message or details, anything passed to the
 * constructor alongside `StatusCode::kOk` is dropped. Error statuses are
 * immutable, copies share their representation.
 */
class Status {
 public:
  Status() = default;
  explicit Status(StatusCode code, std::string message, ErrorInfo info = {});

  bool ok() const { return rep_ == nullptr; }
  StatusCode code() const;
  std::string const& message() const;
  ErrorInfo const& error_info() const;

  friend bool operator==(Status const& a, Status const& b);
  friend bool operator!=(Status const& a, Status const& b) { return !(a == b); }

 private:
  struct Rep;
  std::shared_ptr<Rep const> rep_;
};

/// Formats as `CODE: message`, followed by the error info when present.
std::ostream& operator<<(std::ostream& os, Status const& s);

/// Thrown by `StatusOr<T>::value()` when it holds an error.
class RuntimeStatusError : public std::runtime_error {
 public:
  explicit RuntimeStatusError(Status status);

  Status const& status() const { return status_; }

 private:
  Status status_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_STATUS_H
