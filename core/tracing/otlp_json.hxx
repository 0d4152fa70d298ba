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

#include <tinytrace/span_data.hxx>

#include <tao/json/value.hpp>

#include <vector>

namespace tinytrace::core::tracing::otlp
{
// OTLP enum values, see opentelemetry/proto/trace/v1/trace.proto
constexpr int span_kind_internal = 1;
constexpr int span_kind_server = 2;
constexpr int span_kind_client = 3;

constexpr int status_code_unset = 0;
constexpr int status_code_ok = 1;
constexpr int status_code_error = 2;

constexpr auto instrumentation_scope_name = "tinytrace";

auto
to_json(const attribute_value& value) -> tao::json::value;

auto
to_json(const attribute_map& attributes) -> tao::json::value;

auto
to_json(const span_data& span) -> tao::json::value;

/**
 * ExportTraceServiceRequest in the OTLP/JSON encoding:
 * resourceSpans[1] -> {resource, scopeSpans[1] -> {scope, spans[]}}.
 */
auto
to_export_request(const attribute_map& resource, const std::vector<span_data>& spans)
  -> tao::json::value;
} // namespace tinytrace::core::tracing::otlp
