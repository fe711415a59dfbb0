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

#include "cloudauth/internal/curl_rest_client.h"
#include "cloudauth/internal/curl_wrappers.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/internal/rest_options.h"
#include "cloudauth/log.h"
#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include <curl/curl.h>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

extern "C" {  // libcurl callbacks

// Receive (part of) the response body.
static std::size_t WriteFunction(char* ptr, std::size_t size,
                                 std::size_t nmemb, void* userdata) {
  auto* const buffer = reinterpret_cast<std::string*>(userdata);
  buffer->append(ptr, size * nmemb);
  return size * nmemb;
}

// Receive a response header from peer.
static std::size_t HeaderFunction(char* contents, std::size_t size,
                                  std::size_t nitems, void* userdata) {
  auto* const headers = reinterpret_cast<CurlReceivedHeaders*>(userdata);
  return CurlAppendHeaderData(*headers, contents, size * nitems);
}

}  // extern "C"

std::string MakeEscapedString(CURL* handle, std::string const& s) {
  auto escaped = CurlString(
      curl_easy_escape(handle, s.data(), static_cast<int>(s.size())),
      &curl_free);
  if (!escaped) return s;
  return std::string(escaped.get());
}

std::string BuildUrl(CURL* handle, RestRequest const& request) {
  if (request.parameters().empty()) return request.path();
  auto format = [handle](std::string* out,
                         std::pair<std::string, std::string> const& p) {
    absl::StrAppend(out, MakeEscapedString(handle, p.first), "=",
                    MakeEscapedString(handle, p.second));
  };
  auto const separator =
      request.path().find('?') == std::string::npos ? "?" : "&";
  return absl::StrCat(request.path(), separator,
                      absl::StrJoin(request.parameters(), "&", format));
}

StatusOr<CurlHeaders> BuildHeaders(RestContext const& context,
                                   RestRequest const& request,
                                   Options const& options) {
  CurlHeaders headers(nullptr, &curl_slist_free_all);
  auto append = [&headers](std::string const& line) {
    auto* list = curl_slist_append(headers.get(), line.c_str());
    if (list == nullptr) return false;
    (void)headers.release();
    headers.reset(list);
    return true;
  };
  auto append_all = [&append](HttpHeaders const& h) {
    for (auto const& kv : h) {
      for (auto const& v : kv.second) {
        if (!append(absl::StrCat(kv.first, ": ", v))) return false;
      }
    }
    return true;
  };
  if (!append_all(request.headers()) || !append_all(context.headers())) {
    return internal::InternalError("cannot allocate request headers",
                                   CLOUDAUTH_ERROR_INFO());
  }
  if (options.has<UserAgentOption>() &&
      request.GetHeader("user-agent").empty()) {
    auto line = absl::StrCat("user-agent: ", options.get<UserAgentOption>());
    if (!append(line)) {
      return internal::InternalError("cannot allocate request headers",
                                     CLOUDAUTH_ERROR_INFO());
    }
  }
  return StatusOr<CurlHeaders>(std::move(headers));
}

template <typename T>
Status SetOption(CURL* handle, CURLoption option, T value) {
  auto e = curl_easy_setopt(handle, option, value);
  if (e == CURLE_OK) return Status{};
  return AsStatus(e, "curl_easy_setopt", {});
}

}  // namespace

std::unique_ptr<HttpPayload> CurlRestResponse::ExtractPayload() && {
  return absl::make_unique<StringHttpPayload>(std::move(payload_));
}

std::string FlattenPayload(std::vector<absl::Span<char const>> const& payload) {
  std::string body;
  for (auto const& s : payload) body.append(s.data(), s.size());
  return body;
}

CurlRestClient::CurlRestClient(Options options) : options_(std::move(options)) {
  CurlInitializeOnce();
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Delete(
    RestContext& context, RestRequest const& request) {
  return MakeRequest("DELETE", context, request, absl::nullopt);
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Get(
    RestContext& context, RestRequest const& request) {
  return MakeRequest("GET", context, request, absl::nullopt);
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Patch(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return MakeRequest("PATCH", context, request, FlattenPayload(payload));
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Post(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return MakeRequest("POST", context, request, FlattenPayload(payload));
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Post(
    RestContext& context, RestRequest const& request,
    std::vector<std::pair<std::string, std::string>> const& form_data) {
  auto handle = MakeCurlPtr();
  if (!handle) {
    return internal::InternalError("cannot create libcurl handle",
                                   CLOUDAUTH_ERROR_INFO());
  }
  auto format = [&handle](std::string* out,
                          std::pair<std::string, std::string> const& i) {
    absl::StrAppend(out, MakeEscapedString(handle.get(), i.first), "=",
                    MakeEscapedString(handle.get(), i.second));
  };
  auto form_payload = absl::StrJoin(form_data, "&", format);
  RestRequest form_request = request;
  if (request.GetHeader("content-type").empty()) {
    form_request.AddHeader("content-type", "application/x-www-form-urlencoded");
  }
  return MakeRequest("POST", context, form_request, std::move(form_payload));
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Put(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return MakeRequest("PUT", context, request, FlattenPayload(payload));
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::MakeRequest(
    char const* method, RestContext& context, RestRequest const& request,
    absl::optional<std::string> payload) {
  auto handle = MakeCurlPtr();
  if (!handle) {
    return internal::InternalError("cannot create libcurl handle",
                                   CLOUDAUTH_ERROR_INFO());
  }
  auto* h = handle.get();
  auto options = internal::MergeOptions(context.options(), options_);
  auto headers = BuildHeaders(context, request, options);
  if (!headers) return std::move(headers).status();

  std::string body;
  CurlReceivedHeaders received_headers;
  std::string error_buffer(CURL_ERROR_SIZE, '\0');
  auto const url = BuildUrl(h, request);

  auto status = SetOption(h, CURLOPT_URL, url.c_str());
  if (status.ok()) status = SetOption(h, CURLOPT_NOSIGNAL, 1L);
  if (status.ok()) {
    status = SetOption(h, CURLOPT_ERRORBUFFER, &error_buffer[0]);
  }
  if (status.ok()) status = SetOption(h, CURLOPT_HTTPHEADER, headers->get());
  if (status.ok()) status = SetOption(h, CURLOPT_WRITEFUNCTION, &WriteFunction);
  if (status.ok()) status = SetOption(h, CURLOPT_WRITEDATA, &body);
  if (status.ok()) {
    status = SetOption(h, CURLOPT_HEADERFUNCTION, &HeaderFunction);
  }
  if (status.ok()) {
    status = SetOption(h, CURLOPT_HEADERDATA, &received_headers);
  }
  if (status.ok()) status = SetOption(h, CURLOPT_CUSTOMREQUEST, method);
  if (status.ok() && payload.has_value()) {
    status = SetOption(h, CURLOPT_POSTFIELDSIZE_LARGE,
                       static_cast<curl_off_t>(payload->size()));
    if (status.ok()) status = SetOption(h, CURLOPT_POSTFIELDS, payload->data());
  }
  auto const timeout = options.get<TransferTimeoutOption>();
  if (status.ok() && timeout.count() > 0) {
    auto const ms = static_cast<long>(timeout.count());  // NOLINT
    status = SetOption(h, CURLOPT_TIMEOUT_MS, ms);
  }
  if (!status.ok()) return status;

  CLOUDAUTH_LOG(DEBUG) << method << " " << request.path();
  auto e = curl_easy_perform(h);
  if (e != CURLE_OK) {
    return AsStatus(e, __func__, std::string(error_buffer.c_str()));
  }
  long code = 0;  // NOLINT(google-runtime-int)
  e = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
  if (e != CURLE_OK) return AsStatus(e, __func__, {});

  return std::unique_ptr<RestResponse>(absl::make_unique<CurlRestResponse>(
      static_cast<HttpStatusCode>(code), std::move(received_headers),
      std::move(body)));
}

std::unique_ptr<RestClient> MakeDefaultRestClient(Options options) {
  return absl::make_unique<CurlRestClient>(std::move(options));
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
