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

#include <tinytrace/propagator.hxx>

#include "core/platform/string_hex.h"

#include <fmt/core.h>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tinytrace::propagation
{
namespace
{
constexpr std::size_t version_length{ 2 };
constexpr std::size_t trace_id_length{ 32 };
constexpr std::size_t span_id_length{ 16 };
constexpr std::size_t flags_length{ 2 };
// "vv-" + trace id + "-" + span id + "-" + "ff"
constexpr std::size_t version_00_length{
  version_length + 1 + trace_id_length + 1 + span_id_length + 1 + flags_length
};
constexpr std::uint64_t sampled_flag{ 0x01 };

auto
equals_ignore_case(std::string_view lhs, std::string_view rhs) -> bool
{
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}
} // namespace

auto
format_traceparent(const span_context& context) -> std::string
{
  return fmt::format("00-{}-{}-{}",
                     context.trace_id().to_hex(),
                     context.span_id().to_hex(),
                     context.sampled() ? "01" : "00");
}

auto
parse_traceparent(std::string_view value) -> std::optional<span_context>
{
  if (value.size() < version_00_length) {
    return {};
  }

  auto version = value.substr(0, version_length);
  auto version_number = core::parse_lower_hex(version);
  if (!version_number || version == "ff") {
    return {};
  }
  if (version_number.value() == 0 && value.size() != version_00_length) {
    return {};
  }
  // future versions may append fields, but only after a separator
  if (value.size() > version_00_length && value[version_00_length] != '-') {
    return {};
  }

  std::size_t offset = version_length;
  if (value[offset] != '-') {
    return {};
  }
  ++offset;
  auto trace = trace_id::from_hex(value.substr(offset, trace_id_length));
  offset += trace_id_length;
  if (!trace || !trace->is_valid() || value[offset] != '-') {
    return {};
  }
  ++offset;
  auto parent = span_id::from_hex(value.substr(offset, span_id_length));
  offset += span_id_length;
  if (!parent || !parent->is_valid() || value[offset] != '-') {
    return {};
  }
  ++offset;
  auto flags = core::parse_lower_hex(value.substr(offset, flags_length));
  if (!flags) {
    return {};
  }

  return span_context{
    trace.value(), parent.value(), std::nullopt, (flags.value() & sampled_flag) != 0
  };
}

auto
find_header(const header_map& headers, std::string_view name) -> std::optional<std::string>
{
  if (auto it = headers.find(std::string{ name }); it != headers.end()) {
    return it->second;
  }
  for (const auto& [key, value] : headers) {
    if (equals_ignore_case(key, name)) {
      return value;
    }
  }
  return {};
}

void
inject(const span_context& context, header_map& carrier)
{
  for (auto it = carrier.begin(); it != carrier.end();) {
    if (equals_ignore_case(it->first, traceparent_header)) {
      it = carrier.erase(it);
    } else {
      ++it;
    }
  }
  carrier[traceparent_header] = format_traceparent(context);
}

auto
extract(const header_map& carrier) -> std::optional<span_context>
{
  auto header = find_header(carrier, traceparent_header);
  if (!header) {
    return {};
  }
  return parse_traceparent(header.value());
}
} // namespace tinytrace::propagation
