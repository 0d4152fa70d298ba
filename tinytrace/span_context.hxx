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
#include <optional>
#include <string>
#include <string_view>

namespace tinytrace
{
class sampler;

/**
 * 128-bit identifier shared by every span of one request chain. All-zero is invalid.
 */
class trace_id
{
public:
  trace_id() = default;
  trace_id(std::uint64_t high, std::uint64_t low)
    : high_{ high }
    , low_{ low }
  {
  }

  /**
   * Fresh random identifier, never all-zero.
   */
  static auto random() -> trace_id;

  /**
   * Parses 32 lower-case hex digits.
   */
  static auto from_hex(std::string_view hex) -> std::optional<trace_id>;

  [[nodiscard]] auto to_hex() const -> std::string;

  [[nodiscard]] auto high() const -> std::uint64_t
  {
    return high_;
  }

  [[nodiscard]] auto low() const -> std::uint64_t
  {
    return low_;
  }

  [[nodiscard]] auto is_valid() const -> bool
  {
    return high_ != 0 || low_ != 0;
  }

  friend auto operator==(const trace_id& lhs, const trace_id& rhs) -> bool
  {
    return lhs.high_ == rhs.high_ && lhs.low_ == rhs.low_;
  }

  friend auto operator!=(const trace_id& lhs, const trace_id& rhs) -> bool
  {
    return !(lhs == rhs);
  }

private:
  std::uint64_t high_{ 0 };
  std::uint64_t low_{ 0 };
};

/**
 * 64-bit identifier of a single span. Zero is invalid.
 */
class span_id
{
public:
  span_id() = default;
  explicit span_id(std::uint64_t value)
    : value_{ value }
  {
  }

  static auto random() -> span_id;

  /**
   * Parses 16 lower-case hex digits.
   */
  static auto from_hex(std::string_view hex) -> std::optional<span_id>;

  [[nodiscard]] auto to_hex() const -> std::string;

  [[nodiscard]] auto value() const -> std::uint64_t
  {
    return value_;
  }

  [[nodiscard]] auto is_valid() const -> bool
  {
    return value_ != 0;
  }

  friend auto operator==(const span_id& lhs, const span_id& rhs) -> bool
  {
    return lhs.value_ == rhs.value_;
  }

  friend auto operator!=(const span_id& lhs, const span_id& rhs) -> bool
  {
    return !(lhs == rhs);
  }

private:
  std::uint64_t value_{ 0 };
};

/**
 * Immutable identity of a span: which trace it belongs to, its own id, the id of its parent and
 * the sampling decision made at the root of the trace.
 */
class span_context
{
public:
  span_context(tinytrace::trace_id trace,
               tinytrace::span_id span,
               std::optional<tinytrace::span_id> parent,
               bool sampled)
    : trace_id_{ trace }
    , span_id_{ span }
    , parent_span_id_{ parent }
    , sampled_{ sampled }
  {
  }

  /**
   * Context of a new trace. The sampler is consulted exactly once, here.
   */
  static auto generate_root(const sampler& root_sampler) -> span_context;

  /**
   * Context of a child span: same trace, fresh span id, parent set to @p parent's span id, and
   * the parent's sampling decision.
   */
  static auto derive_child(const span_context& parent) -> span_context;

  [[nodiscard]] auto trace_id() const -> const tinytrace::trace_id&
  {
    return trace_id_;
  }

  [[nodiscard]] auto span_id() const -> const tinytrace::span_id&
  {
    return span_id_;
  }

  [[nodiscard]] auto parent_span_id() const -> const std::optional<tinytrace::span_id>&
  {
    return parent_span_id_;
  }

  [[nodiscard]] auto sampled() const -> bool
  {
    return sampled_;
  }

  [[nodiscard]] auto is_valid() const -> bool
  {
    return trace_id_.is_valid() && span_id_.is_valid();
  }

private:
  tinytrace::trace_id trace_id_;
  tinytrace::span_id span_id_;
  std::optional<tinytrace::span_id> parent_span_id_;
  bool sampled_;
};
} // namespace tinytrace
