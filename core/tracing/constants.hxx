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

namespace tinytrace::core::tracing
{
namespace attributes
{
// Attributes of server spans opened by the middleware
namespace http
{
constexpr auto request_method = "http.request.method";
constexpr auto route = "http.route";
constexpr auto response_status_code = "http.response.status_code";
} // namespace http

namespace url
{
constexpr auto path = "url.path";
} // namespace url

constexpr auto user_agent_original = "user_agent.original";
constexpr auto request_id = "request.id";
constexpr auto service_name = "service.name";
} // namespace attributes

// Attributes describing the process that produces the spans, attached to every export
namespace resource
{
constexpr auto service_name = "service.name";
constexpr auto service_version = "service.version";
constexpr auto deployment_environment = "deployment.environment";
constexpr auto service_instance_id = "service.instance.id";
constexpr auto telemetry_sdk_name = "telemetry.sdk.name";
constexpr auto telemetry_sdk_language = "telemetry.sdk.language";
constexpr auto telemetry_sdk_version = "telemetry.sdk.version";
} // namespace resource

namespace headers
{
constexpr auto traceparent = "traceparent";
constexpr auto user_agent = "user-agent";
} // namespace headers

namespace status_messages
{
constexpr auto cancelled = "cancelled";
constexpr auto unknown_exception = "unknown exception";
} // namespace status_messages
} // namespace tinytrace::core::tracing
