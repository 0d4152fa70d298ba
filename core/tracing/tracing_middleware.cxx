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

#include <tinytrace/fmt/span_context.hxx>
#include <tinytrace/tracing_middleware.hxx>

#include "constants.hxx"
#include "core/logger/logger.hxx"
#include "core/platform/uuid.h"
#include "usage_error.hxx"

#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tinytrace
{
namespace
{
auto
status_for(std::uint32_t status_code) -> span_status
{
  if (status_code >= 500) {
    return span_status::error(fmt::format("HTTP {}", status_code));
  }
  return span_status::ok();
}
} // namespace

server_request_scope::server_request_scope(std::shared_ptr<tracer> owner,
                                           std::shared_ptr<execution_context> context,
                                           std::shared_ptr<tinytrace::span> server_span,
                                           std::string request_id,
                                           std::string method,
                                           std::string target)
  : tracer_{ std::move(owner) }
  , context_{ std::move(context) }
  , span_{ std::move(server_span) }
  , binding_{ context_->bind(span_) }
  , request_id_{ std::move(request_id) }
  , method_{ std::move(method) }
  , target_{ std::move(target) }
{
}

server_request_scope::server_request_scope(server_request_scope&& other) noexcept
  : tracer_{ std::move(other.tracer_) }
  , context_{ std::move(other.context_) }
  , span_{ std::move(other.span_) }
  , binding_{ std::move(other.binding_) }
  , request_id_{ std::move(other.request_id_) }
  , method_{ std::move(other.method_) }
  , target_{ std::move(other.target_) }
  , started_{ other.started_ }
  , closed_{ std::exchange(other.closed_, true) }
{
}

server_request_scope::~server_request_scope()
{
  if (!closed_ && span_) {
    close(span_status::error(core::tracing::status_messages::cancelled), std::nullopt);
  }
}

void
server_request_scope::complete(outbound_response& response)
{
  if (closed_) {
    core::tracing::report_usage_error(
      fmt::format("request {} completed after it has been closed", request_id_));
    return;
  }
  if (const auto& options = tracer_->options(); options.include_trace_id_header) {
    response.headers[options.trace_id_header_name] = span_->context().trace_id().to_hex();
  }
  close(status_for(response.status_code), response.status_code);
}

void
server_request_scope::complete(std::uint32_t status_code)
{
  if (closed_) {
    core::tracing::report_usage_error(
      fmt::format("request {} completed after it has been closed", request_id_));
    return;
  }
  close(status_for(status_code), status_code);
}

void
server_request_scope::fail(std::string message)
{
  if (closed_) {
    core::tracing::report_usage_error(
      fmt::format("request {} failed after it has been closed", request_id_));
    return;
  }
  close(span_status::error(std::move(message)), std::nullopt);
}

void
server_request_scope::close(span_status status, std::optional<std::uint32_t> http_status)
{
  closed_ = true;
  if (http_status) {
    span_->set_attribute(core::tracing::attributes::http::response_status_code,
                         static_cast<std::int64_t>(http_status.value()));
  }
  auto outcome = status.code() == status_code::error ? status.message() : std::string{ "ok" };
  span_->set_status(std::move(status));
  span_->end();
  binding_.release();

  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started_);
  auto slow = duration >= tracer_->options().slow_request_threshold;
  auto status_text = http_status ? std::to_string(http_status.value()) : std::string{ "-" };

  if (!http_status || http_status.value() >= 500) {
    TT_LOG_ERROR("request failed: request_id={}, {} {}, status={}, outcome=\"{}\", "
                 "duration_ms={}, trace_id={}",
                 request_id_,
                 method_,
                 target_,
                 status_text,
                 outcome,
                 duration.count(),
                 span_->context().trace_id());
  } else if (http_status.value() >= 400 || slow) {
    TT_LOG_WARNING("{}: request_id={}, {} {}, status={}, duration_ms={}, trace_id={}",
                   slow ? "slow request completed" : "request completed with client error",
                   request_id_,
                   method_,
                   target_,
                   status_text,
                   duration.count(),
                   span_->context().trace_id());
  } else {
    TT_LOG_INFO("request completed: request_id={}, {} {}, status={}, duration_ms={}, trace_id={}",
                request_id_,
                method_,
                target_,
                status_text,
                duration.count(),
                span_->context().trace_id());
  }
}

tracing_middleware::tracing_middleware(std::shared_ptr<tracer> tracer)
  : tracer_{ std::move(tracer) }
{
}

auto
tracing_middleware::begin(const inbound_request& request) -> server_request_scope
{
  using namespace core::tracing;

  auto parent = propagation::extract(request.headers);
  if (!parent) {
    if (auto header = propagation::find_header(request.headers, headers::traceparent); header) {
      TT_LOG_DEBUG("ignoring malformed traceparent header \"{}\", starting a new trace",
                   header.value());
    }
  }

  auto server_span = tracer_->start_span(
    fmt::format("{} {}", request.method, request.route), span_kind::server, parent);
  auto request_id = core::uuid::to_string(core::uuid::random());

  server_span->set_attribute(attributes::http::request_method, request.method);
  server_span->set_attribute(attributes::http::route, request.route);
  server_span->set_attribute(attributes::url::path, request.target);
  if (auto user_agent = propagation::find_header(request.headers, headers::user_agent);
      user_agent) {
    server_span->set_attribute(attributes::user_agent_original, user_agent.value());
  }
  server_span->set_attribute(attributes::request_id, request_id);
  server_span->set_attribute(attributes::service_name, tracer_->options().service_name);

  return server_request_scope{
    tracer_,       execution_context::create(), std::move(server_span), std::move(request_id),
    request.method, request.target,
  };
}

auto
tracing_middleware::start_outbound_span(std::string name, header_map& headers)
  -> std::shared_ptr<tinytrace::span>
{
  return tinytrace::start_outbound_span(*tracer_, std::move(name), headers);
}

auto
start_outbound_span(tracer& owner, std::string name, header_map& headers) -> std::shared_ptr<span>
{
  auto client_span = owner.start_span(std::move(name), span_kind::client);
  propagation::inject(client_span->context(), headers);
  return client_span;
}
} // namespace tinytrace
