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

#include "otlp_json.hxx"

#include <tinytrace/build_config.hxx>

#include <tao/json/value.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tinytrace::core::tracing::otlp
{
namespace
{
auto
unix_nanos(std::chrono::system_clock::time_point time_point) -> std::string
{
  // 64-bit integers are encoded as decimal strings in OTLP/JSON
  return std::to_string(
    std::chrono::duration_cast<std::chrono::nanoseconds>(time_point.time_since_epoch()).count());
}

/**
 * JSON has no literal for NaN and infinities, the protobuf JSON mapping spells them as strings.
 */
auto
double_value(double value) -> tao::json::value
{
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }
  return value;
}

auto
otlp_kind(span_kind kind) -> int
{
  switch (kind) {
    case span_kind::internal:
      return span_kind_internal;
    case span_kind::server:
      return span_kind_server;
    case span_kind::client:
      return span_kind_client;
  }
  return span_kind_internal;
}

auto
otlp_status(const span_status& status) -> tao::json::value
{
  switch (status.code()) {
    case status_code::unset:
      return { { "code", status_code_unset } };
    case status_code::ok:
      return { { "code", status_code_ok } };
    case status_code::error:
      return { { "code", status_code_error }, { "message", status.message() } };
  }
  return { { "code", status_code_unset } };
}
} // namespace

auto
to_json(const attribute_value& value) -> tao::json::value
{
  return std::visit(
    [](const auto& v) -> tao::json::value {
      using value_type = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<value_type, bool>) {
        return { { "boolValue", v } };
      } else if constexpr (std::is_same_v<value_type, std::int64_t>) {
        return { { "intValue", std::to_string(v) } };
      } else if constexpr (std::is_same_v<value_type, double>) {
        return { { "doubleValue", double_value(v) } };
      } else {
        return { { "stringValue", v } };
      }
    },
    value);
}

auto
to_json(const attribute_map& attributes) -> tao::json::value
{
  tao::json::value entries = tao::json::empty_array;
  for (const auto& [key, value] : attributes) {
    entries.emplace_back(tao::json::value{
      { "key", key },
      { "value", to_json(value) },
    });
  }
  return entries;
}

auto
to_json(const span_data& span) -> tao::json::value
{
  tao::json::value entry{
    { "traceId", span.context.trace_id().to_hex() },
    { "spanId", span.context.span_id().to_hex() },
    { "name", span.name },
    { "kind", otlp_kind(span.kind) },
    { "startTimeUnixNano", unix_nanos(span.start_time) },
    { "endTimeUnixNano", unix_nanos(span.end_time) },
    { "attributes", to_json(span.attributes) },
    { "status", otlp_status(span.status) },
  };
  if (const auto& parent = span.context.parent_span_id(); parent) {
    entry["parentSpanId"] = parent->to_hex();
  }
  if (!span.events.empty()) {
    tao::json::value events = tao::json::empty_array;
    for (const auto& event : span.events) {
      events.emplace_back(tao::json::value{
        { "timeUnixNano", unix_nanos(event.timestamp) },
        { "name", event.name },
        { "attributes", to_json(event.attributes) },
      });
    }
    entry["events"] = std::move(events);
  }
  return entry;
}

auto
to_export_request(const attribute_map& resource, const std::vector<span_data>& spans)
  -> tao::json::value
{
  tao::json::value entries = tao::json::empty_array;
  for (const auto& span : spans) {
    entries.emplace_back(to_json(span));
  }

  tao::json::value scope_spans = tao::json::empty_array;
  scope_spans.emplace_back(tao::json::value{
    { "scope",
      tao::json::value{
        { "name", instrumentation_scope_name },
        { "version", TINYTRACE_VERSION_STRING },
      } },
    { "spans", std::move(entries) },
  });

  tao::json::value resource_spans = tao::json::empty_array;
  resource_spans.emplace_back(tao::json::value{
    { "resource", tao::json::value{ { "attributes", to_json(resource) } } },
    { "scopeSpans", std::move(scope_spans) },
  });

  return tao::json::value{ { "resourceSpans", std::move(resource_spans) } };
}
} // namespace tinytrace::core::tracing::otlp
