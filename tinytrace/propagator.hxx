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

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tinytrace
{
/**
 * Request/response headers as exchanged with the HTTP layer.
 */
using header_map = std::map<std::string, std::string>;

/**
 * W3C Trace Context (traceparent) propagation.
 */
namespace propagation
{
constexpr auto traceparent_header = "traceparent";

/**
 * Writes the context as a version 00 traceparent header:
 * "00-{trace_id:32}-{span_id:16}-{flags:2}", lower-case hex, flag 01 when sampled. Any existing
 * traceparent header (in any letter case) is replaced.
 */
void
inject(const span_context& context, header_map& carrier);

/**
 * Looks up traceparent case-insensitively and parses it. The span id of the returned context is
 * the remote parent's one.
 *
 * @return empty optional when the header is absent or malformed
 */
auto
extract(const header_map& carrier) -> std::optional<span_context>;

auto
format_traceparent(const span_context& context) -> std::string;

/**
 * Strict parser. Rejects version ff, upper-case or non-hex digits, wrong segment lengths,
 * all-zero ids and trailing data after a version 00 header. Higher versions may carry extra
 * "-"-separated fields.
 */
auto
parse_traceparent(std::string_view value) -> std::optional<span_context>;

/**
 * Case-insensitive header lookup.
 */
auto
find_header(const header_map& headers, std::string_view name) -> std::optional<std::string>;
} // namespace propagation
} // namespace tinytrace
