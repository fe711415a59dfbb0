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

#ifndef CLOUDAUTH_INTERNAL_VERSION_INFO_H
#define CLOUDAUTH_INTERNAL_VERSION_INFO_H

// NOLINTNEXTLINE(modernize-macro-to-enum)
#define CLOUDAUTH_VERSION_MAJOR 0
// NOLINTNEXTLINE(modernize-macro-to-enum)
#define CLOUDAUTH_VERSION_MINOR 3
// NOLINTNEXTLINE(modernize-macro-to-enum)
#define CLOUDAUTH_VERSION_PATCH 0
#define CLOUDAUTH_PRE_RELEASE ""

#endif  // CLOUDAUTH_INTERNAL_VERSION_INFO_H
