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

#ifndef CLOUDAUTH_INTERNAL_CURL_WRAPPERS_H
#define CLOUDAUTH_INTERNAL_CURL_WRAPPERS_H

#include "cloudauth/status.h"
#include "cloudauth/version.h"
#include <curl/curl.h>
#include <map>
#include <memory>
#include <string>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// Hold a CURL* handle and automatically clean it up.
using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

/// Returns a new easy handle, null if libcurl cannot allocate one.
CurlPtr MakeCurlPtr();

/// Hold a character string created by CURL use correct deleter.
using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

/// Hold a list of request headers created by `curl_slist_append()`.
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

using CurlReceivedHeaders = std::multimap<std::string, std::string>;

/**
 * Parses one response header line, as delivered by `CURLOPT_HEADERFUNCTION`.
 *
 * Header names are stored in lowercase. Lines that do not end in `\r\n`, and
 * the empty line ending the headers, are ignored.
 */
std::size_t CurlAppendHeaderData(CurlReceivedHeaders& received_headers,
                                 char const* data, std::size_t size);

/// Initializes libcurl (and ignores SIGPIPE) exactly once per process.
void CurlInitializeOnce();

/**
 * Converts a libcurl error into a `Status`.
 *
 * Timeouts are `kDeadlineExceeded`, every other failure is a transport error
 * (`kUnavailable`). @p error_buffer is the `CURLOPT_ERRORBUFFER` contents, if
 * any.
 */
Status AsStatus(CURLcode e, char const* where, std::string const& error_buffer);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_CURL_WRAPPERS_H
