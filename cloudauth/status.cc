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

#include "cloudauth/status.h"
#include <ostream>
#include <sstream>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

struct Status::Rep {
  StatusCode code;
  std::string message;
  ErrorInfo info;
};

std::string StatusCodeToString(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "OK";
    case StatusCode::kUnknown:
      return "UNKNOWN";
    case StatusCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case StatusCode::kDeadlineExceeded:
      return "DEADLINE_EXCEEDED";
    case StatusCode::kNotFound:
      return "NOT_FOUND";
    case StatusCode::kPermissionDenied:
      return "PERMISSION_DENIED";
    case StatusCode::kUnimplemented:
      return "UNIMPLEMENTED";
    case StatusCode::kInternal:
      return "INTERNAL";
    case StatusCode::kUnavailable:
      return "UNAVAILABLE";
    case StatusCode::kUnauthenticated:
      return "UNAUTHENTICATED";
  }
  return "UNEXPECTED_STATUS_CODE=" + std::to_string(static_cast<int>(code));
}

std::ostream& operator<<(std::ostream& os, StatusCode code) {
  return os << StatusCodeToString(code);
}

Status::Status(StatusCode code, std::string message, ErrorInfo info) {
  if (code == StatusCode::kOk) return;
  rep_ = std::make_shared<Rep const>(
      Rep{code, std::move(message), std::move(info)});
}

StatusCode Status::code() const { return rep_ ? rep_->code : StatusCode::kOk; }

std::string const& Status::message() const {
  static auto const* const kEmpty = new std::string;
  return rep_ ? rep_->message : *kEmpty;
}

ErrorInfo const& Status::error_info() const {
  static auto const* const kEmpty = new ErrorInfo;
  return rep_ ? rep_->info : *kEmpty;
}

bool operator==(Status const& a, Status const& b) {
  if (a.rep_ == b.rep_) return true;
  if (!a.rep_ || !b.rep_) return false;
  return a.rep_->code == b.rep_->code && a.rep_->message == b.rep_->message &&
         a.rep_->info == b.rep_->info;
}

std::ostream& operator<<(std::ostream& os, Status const& s) {
  os << s.code();
  if (s.ok()) return os;
  os << ": " << s.message();
  auto const& info = s.error_info();
  if (info.empty()) return os;
  os << " error_info={reason=" << info.reason()
     << ", domain=" << info.domain() << ", metadata={";
  char const* sep = "";
  for (auto const& kv : info.metadata()) {
    os << sep << kv.first << "=" << kv.second;
    sep = ", ";
  }
  return os << "}}";
}

RuntimeStatusError::RuntimeStatusError(Status status)
    : std::runtime_error([&status] {
        std::ostringstream os;
        os << status;
        return std::move(os).str();
      }()),
      status_(std::move(status)) {}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
