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

#include <tinytrace/execution_context.hxx>
#include <tinytrace/propagator.hxx>
#include <tinytrace/span.hxx>
#include <tinytrace/tracer.hxx>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tinytrace
{
/**
 * What the HTTP layer knows about an inbound request before running the handler.
 */
struct inbound_request {
  std::string method;
  /** route template, e.g. "/users/{id}" */
  std::string route;
  /** request target as received, e.g. "/users/42?verbose=1" */
  std::string target;
  header_map headers{};
};

struct outbound_response {
  std::uint32_t status_code{ 200 };
  header_map headers{};
  std::string body{};
};

class tracing_middleware;

/**
 * Server span of one inbound request, bound to the request's own execution context.
 *
 * The scope must be closed once, with complete() or fail(). A scope destroyed while still open
 * (cancellation, timeout, early return) closes its span with the "cancelled" error status.
 */
class server_request_scope
{
public:
  server_request_scope(const server_request_scope& other) = delete;
  auto operator=(const server_request_scope& other) -> server_request_scope& = delete;
  server_request_scope(server_request_scope&& other) noexcept;
  auto operator=(server_request_scope&& other) -> server_request_scope& = delete;
  ~server_request_scope();

  [[nodiscard]] auto span() const -> const std::shared_ptr<tinytrace::span>&
  {
    return span_;
  }

  [[nodiscard]] auto context() const -> const std::shared_ptr<execution_context>&
  {
    return context_;
  }

  [[nodiscard]] auto request_id() const -> const std::string&
  {
    return request_id_;
  }

  [[nodiscard]] auto is_closed() const -> bool
  {
    return closed_;
  }

  /**
   * Runs the function with the request's execution context installed on the calling thread.
   */
  template<typename Function>
  auto run(Function&& function) -> decltype(std::forward<Function>(function)())
  {
    return context_->run(std::forward<Function>(function));
  }

  /**
   * Binds a continuation of the request (e.g. an asynchronous completion handler) to its
   * execution context.
   */
  template<typename Handler>
  auto wrap(Handler&& handler)
  {
    return context_->attach(std::forward<Handler>(handler));
  }

  /**
   * Records the response status on the span, sets the status (error for 5xx, ok otherwise), adds
   * the trace id response header when enabled, and closes the span.
   */
  void complete(outbound_response& response);

  /**
   * Same as complete(), for callers that do not expose a response object.
   */
  void complete(std::uint32_t status_code);

  /**
   * Closes the span with the given error message (handler failure).
   */
  void fail(std::string message);

private:
  friend class tracing_middleware;

  server_request_scope(std::shared_ptr<tracer> owner,
                       std::shared_ptr<execution_context> context,
                       std::shared_ptr<tinytrace::span> server_span,
                       std::string request_id,
                       std::string method,
                       std::string target);

  void close(span_status status, std::optional<std::uint32_t> http_status);

  std::shared_ptr<tracer> tracer_;
  std::shared_ptr<execution_context> context_;
  std::shared_ptr<tinytrace::span> span_;
  execution_context::binding_guard binding_{};
  std::string request_id_;
  std::string method_;
  std::string target_;
  std::chrono::steady_clock::time_point started_{ std::chrono::steady_clock::now() };
  bool closed_{ false };
};

/**
 * Adapter between an HTTP layer and the tracer: opens a server span for every inbound request
 * (continuing the caller's trace when a valid traceparent header is present), and prepares client
 * spans for outbound calls.
 */
class tracing_middleware
{
public:
  explicit tracing_middleware(std::shared_ptr<tracer> tracer);

  /**
   * Opens the server span "{method} {route}" in a new execution context.
   */
  [[nodiscard]] auto begin(const inbound_request& request) -> server_request_scope;

  /**
   * Runs a synchronous handler inside the request scope. A handler exception closes the span with
   * the exception message and is rethrown.
   */
  template<typename Handler>
  auto handle(const inbound_request& request, Handler&& handler) -> outbound_response
  {
    auto scope = begin(request);
    outbound_response response{};
    try {
      response = scope.run([&handler, &request]() -> outbound_response {
        return std::forward<Handler>(handler)(request);
      });
    } catch (const std::exception& e) {
      scope.fail(e.what());
      throw;
    } catch (...) {
      scope.fail("unknown exception");
      throw;
    }
    scope.complete(response);
    return response;
  }

  /**
   * Starts a client span under the current span of the calling execution context and injects it
   * into the outgoing headers. The caller ends the span when the call completes.
   */
  [[nodiscard]] auto start_outbound_span(std::string name, header_map& headers)
    -> std::shared_ptr<tinytrace::span>;

  [[nodiscard]] auto get_tracer() const -> const std::shared_ptr<tracer>&
  {
    return tracer_;
  }

private:
  std::shared_ptr<tracer> tracer_;
};

/**
 * Client span for an outbound call, child of the current span, injected into @p headers.
 */
auto
start_outbound_span(tracer& owner, std::string name, header_map& headers)
  -> std::shared_ptr<span>;
} // namespace tinytrace
