/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace tinytrace::core::io
{
struct http_response {
  std::uint32_t status_code{};
  std::string status_message{};
  /** header names are stored in lower case */
  std::map<std::string, std::string> headers{};
  std::string body{};

  [[nodiscard]] auto is_success() const -> bool
  {
    return status_code >= 200 && status_code < 300;
  }
};
} // namespace tinytrace::core::io
