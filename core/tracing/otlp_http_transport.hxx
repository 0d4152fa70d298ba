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
#include <tinytrace/span_transport.hxx>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tinytrace::core::tracing
{
struct http_endpoint {
  std::string host;
  std::string port{ "80" };
  std::string path{ "/v1/traces" };

  [[nodiscard]] auto host_header() const -> std::string;
};

/**
 * Parses "http://host[:port][/path]". The path defaults to /v1/traces. IPv6 literals are accepted
 * in brackets.
 */
auto
parse_http_endpoint(std::string_view url) -> std::optional<http_endpoint>;

/**
 * Posts batches as OTLP/JSON (ExportTraceServiceRequest) to an OTLP/HTTP collector.
 *
 * Every send() uses its own connection and io_context, and is bounded by the export timeout.
 */
class otlp_http_transport : public span_transport
{
public:
  otlp_http_transport(std::string endpoint,
                      attribute_map resource,
                      std::chrono::milliseconds timeout);

  [[nodiscard]] auto send(const std::vector<span_data>& batch) -> std::error_code override;

  [[nodiscard]] auto description() const -> std::string override;

private:
  std::string url_;
  std::optional<http_endpoint> endpoint_;
  attribute_map resource_;
  std::chrono::milliseconds timeout_;
};
} // namespace tinytrace::core::tracing
