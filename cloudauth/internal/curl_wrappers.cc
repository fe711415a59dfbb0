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

#include "cloudauth/internal/curl_wrappers.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include <algorithm>
#include <csignal>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

/// Automatically initialize (and cleanup) the libcurl library.
class CurlInitializer {
 public:
  CurlInitializer() { curl_global_init(CURL_GLOBAL_ALL); }
  ~CurlInitializer() { curl_global_cleanup(); }
};

void InitializeSigPipeHandler() {
#if defined(SIGPIPE)
  std::signal(SIGPIPE, SIG_IGN);
#endif  // SIGPIPE
}

}  // namespace

CurlPtr MakeCurlPtr() { return CurlPtr(curl_easy_init(), &curl_easy_cleanup); }

std::size_t CurlAppendHeaderData(CurlReceivedHeaders& received_headers,
                                 char const* data, std::size_t size) {
  // Empty header (including the \r\n), ignore.
  if (size <= 2) return size;
  // Invalid header (should end in \r\n), ignore.
  if ('\r' != data[size - 2] || '\n' != data[size - 1]) return size;
  auto const* separator = std::find(data, data + size, ':');
  std::string header_name = std::string(data, separator);
  std::string header_value;
  if (static_cast<std::size_t>(separator - data) < size - 2) {
    header_value = std::string(separator + 1, data + size - 2);
    absl::StripAsciiWhitespace(&header_value);
  }
  absl::AsciiStrToLower(&header_name);
  received_headers.emplace(std::move(header_name), std::move(header_value));
  return size;
}

void CurlInitializeOnce() {
  static CurlInitializer curl_initializer;
  static bool const kInitialized = [] {
    // CURLOPT_NOSIGNAL is set on every handle, libcurl then expects the
    // application to deal with SIGPIPE.
    InitializeSigPipeHandler();
    return true;
  }();
  static_cast<void>(kInitialized);
}

Status AsStatus(CURLcode e, char const* where,
                std::string const& error_buffer) {
  auto message = absl::StrCat(where, "() - CURL error [", static_cast<int>(e),
                              "]=", curl_easy_strerror(e));
  if (!error_buffer.empty()) absl::StrAppend(&message, ": ", error_buffer);
  auto info = CLOUDAUTH_ERROR_INFO().WithMetadata(
      "curl.code", std::to_string(static_cast<int>(e)));
  switch (e) {
    case CURLE_OK:
      return Status{};
    case CURLE_OPERATION_TIMEDOUT:
      return internal::DeadlineExceededError(std::move(message),
                                             std::move(info));
    case CURLE_OUT_OF_MEMORY:
      return internal::InternalError(std::move(message), std::move(info));
    default:
      return internal::TransportError(std::move(message), std::move(info));
  }
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
