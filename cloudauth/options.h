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

#ifndef CLOUDAUTH_OPTIONS_H
#define CLOUDAUTH_OPTIONS_H

#include "cloudauth/version.h"
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

class Options;
namespace internal {
Options MergeOptions(Options, Options);
}  // namespace internal

/**
 * Configuration values for credentials and transports, keyed by option type.
 *
 * An option is a struct with a public `Type` member typedef, named
 * `FooOption` by convention. The credential options live in
 * `cloudauth/oauth2/options.h`, the transport options in
 * `cloudauth/internal/rest_options.h`. `get<T>()` on an unset option returns
 * a value-initialized `T::Type`, so callers that need a non-zero default
 * check `has<T>()` first.
 *
 * Values are immutable once stored, copies of an `Options` share them.
 *
 * @code
 * auto options = Options{}
 *     .set<oauth2::MaxRefreshAttemptsOption>(1)
 *     .set<oauth2::RefreshStatusCodesOption>({401, 403});
 * @endcode
 */
class Options {
  template <typename T>
  using ValueTypeT = typename T::Type;

 public:
  template <typename T>
  Options& set(ValueTypeT<T> v) {
    values_[typeid(T)] = std::make_shared<ValueTypeT<T> const>(std::move(v));
    return *this;
  }

  template <typename T>
  bool has() const {
    return values_.count(typeid(T)) != 0;
  }

  template <typename T>
  ValueTypeT<T> const& get() const {
    auto const it = values_.find(typeid(T));
    if (it == values_.end()) {
      static auto const* const kDefault = new ValueTypeT<T>{};
      return *kDefault;
    }
    return *static_cast<ValueTypeT<T> const*>(it->second.get());
  }

 private:
  friend Options internal::MergeOptions(Options, Options);

  std::unordered_map<std::type_index, std::shared_ptr<void const>> values_;
};

namespace internal {

/// Returns @p preferred plus any option it does not set from @p alternatives.
Options MergeOptions(Options preferred, Options alternatives);

}  // namespace internal

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_OPTIONS_H
