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

#include <tinytrace/sampler.hxx>
#include <tinytrace/span_context.hxx>

#include "core/platform/random.h"
#include "core/platform/string_hex.h"

#include <optional>
#include <string>
#include <string_view>

namespace tinytrace
{
auto
trace_id::random() -> trace_id
{
  return { core::random_uint64(), core::random_nonzero_uint64() };
}

auto
trace_id::from_hex(std::string_view hex) -> std::optional<trace_id>
{
  if (hex.size() != 32) {
    return {};
  }
  auto high = core::parse_lower_hex(hex.substr(0, 16));
  auto low = core::parse_lower_hex(hex.substr(16));
  if (!high || !low) {
    return {};
  }
  return trace_id{ high.value(), low.value() };
}

auto
trace_id::to_hex() const -> std::string
{
  return core::to_hex_digits(high_) + core::to_hex_digits(low_);
}

auto
span_id::random() -> span_id
{
  return span_id{ core::random_nonzero_uint64() };
}

auto
span_id::from_hex(std::string_view hex) -> std::optional<span_id>
{
  if (hex.size() != 16) {
    return {};
  }
  if (auto value = core::parse_lower_hex(hex); value) {
    return span_id{ value.value() };
  }
  return {};
}

auto
span_id::to_hex() const -> std::string
{
  return core::to_hex_digits(value_);
}

auto
span_context::generate_root(const sampler& root_sampler) -> span_context
{
  auto trace = tinytrace::trace_id::random();
  return { trace, tinytrace::span_id::random(), std::nullopt, root_sampler.decide(trace) };
}

auto
span_context::derive_child(const span_context& parent) -> span_context
{
  return { parent.trace_id(), tinytrace::span_id::random(), parent.span_id(), parent.sampled() };
}
} // namespace tinytrace
