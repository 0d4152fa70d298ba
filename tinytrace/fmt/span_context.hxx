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
#include <tinytrace/span_data.hxx>

#include <fmt/core.h>

/**
 * Helper for fmtlib to format @ref tinytrace::trace_id objects as 32 lower-case hex digits.
 */
template<>
struct fmt::formatter<tinytrace::trace_id> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(const tinytrace::trace_id& id, FormatContext& ctx) const
  {
    return format_to(ctx.out(), "{}", id.to_hex());
  }
};

/**
 * Helper for fmtlib to format @ref tinytrace::span_id objects as 16 lower-case hex digits.
 */
template<>
struct fmt::formatter<tinytrace::span_id> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(const tinytrace::span_id& id, FormatContext& ctx) const
  {
    return format_to(ctx.out(), "{}", id.to_hex());
  }
};

template<>
struct fmt::formatter<tinytrace::span_kind> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(tinytrace::span_kind kind, FormatContext& ctx) const
  {
    return format_to(ctx.out(), "{}", tinytrace::to_string(kind));
  }
};

template<>
struct fmt::formatter<tinytrace::status_code> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(tinytrace::status_code code, FormatContext& ctx) const
  {
    return format_to(ctx.out(), "{}", tinytrace::to_string(code));
  }
};
