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

#include <tinytrace/span_context.hxx>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tinytrace
{
enum class span_kind {
  internal,
  server,
  client,
};

using attribute_value = std::variant<bool, std::int64_t, double, std::string>;
using attribute_map = std::map<std::string, attribute_value>;

enum class status_code {
  unset,
  ok,
  error,
};

class span_status
{
public:
  span_status() = default;

  static auto ok() -> span_status
  {
    return span_status{ status_code::ok, {} };
  }

  static auto error(std::string message) -> span_status
  {
    return span_status{ status_code::error, std::move(message) };
  }

  [[nodiscard]] auto code() const -> status_code
  {
    return code_;
  }

  [[nodiscard]] auto message() const -> const std::string&
  {
    return message_;
  }

private:
  span_status(status_code code, std::string message)
    : code_{ code }
    , message_{ std::move(message) }
  {
  }

  status_code code_{ status_code::unset };
  std::string message_{};
};

struct span_event {
  std::string name;
  std::chrono::system_clock::time_point timestamp;
  attribute_map attributes{};
};

/**
 * Record of a closed span, as handed over to the exporter.
 */
struct span_data {
  span_context context;
  std::string name;
  span_kind kind{ span_kind::internal };
  std::chrono::system_clock::time_point start_time{};
  std::chrono::system_clock::time_point end_time{};
  attribute_map attributes{};
  std::vector<span_event> events{};
  span_status status{};
};

auto
to_string(span_kind kind) -> const char*;

auto
to_string(status_code code) -> const char*;
} // namespace tinytrace
