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
#include <tinytrace/sampler.hxx>
#include <tinytrace/span.hxx>
#include <tinytrace/span_context.hxx>
#include <tinytrace/span_data.hxx>
#include <tinytrace/span_exporter.hxx>
#include <tinytrace/tracing_options.hxx>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace asio
{
class io_context;
} // namespace asio

namespace tinytrace
{
namespace detail
{
/**
 * Closes the span when leaving the enclosing scope, whatever the exit path.
 */
class span_closer
{
public:
  explicit span_closer(std::shared_ptr<span> target)
    : span_{ std::move(target) }
  {
  }
  span_closer(const span_closer& other) = delete;
  span_closer(span_closer&& other) = delete;
  auto operator=(const span_closer& other) -> span_closer& = delete;
  auto operator=(span_closer&& other) -> span_closer& = delete;

  ~span_closer()
  {
    if (!span_->has_ended()) {
      span_->end();
    }
  }

private:
  std::shared_ptr<span> span_;
};
} // namespace detail

/**
 * Entry point of the library: creates spans, and owns the sampler and the exporter.
 *
 * The tracer is safe to use from any thread. Spans started without an explicit parent become
 * children of the current span of the calling execution context.
 */
class tracer : public std::enable_shared_from_this<tracer>
{
public:
  /**
   * Builds the sampler, the transport and the batching exporter described by the options. The
   * exporter runs its periodic flushes and exports on @p ctx.
   */
  static auto create(asio::io_context& ctx, const tracing_options& options)
    -> std::shared_ptr<tracer>;

  tracer(tracing_options::built options,
         std::shared_ptr<span_exporter> exporter,
         attribute_map resource = {});
  tracer(const tracer& other) = delete;
  tracer(tracer&& other) = delete;
  auto operator=(const tracer& other) -> tracer& = delete;
  auto operator=(tracer&& other) -> tracer& = delete;
  ~tracer() = default;

  void start();

  /**
   * Shuts the exporter down, delivering the spans it still holds.
   */
  void stop();

  void flush();

  /**
   * Starts a span under the given parent, or a new trace when @p parent is empty. The sampler is
   * only consulted for new traces.
   */
  [[nodiscard]] auto start_span(std::string name,
                                span_kind kind,
                                std::optional<span_context> parent) -> std::shared_ptr<span>;

  /**
   * Starts a span under the current span of the calling execution context (or a new trace when
   * nothing is bound).
   */
  [[nodiscard]] auto start_span(std::string name, span_kind kind = span_kind::internal)
    -> std::shared_ptr<span>;

  /**
   * Runs the operation inside an internal span bound to the current execution context. The span
   * is closed on every exit path, and exceptions mark it with an error status before being
   * rethrown.
   */
  template<typename Operation>
  auto instrumented(std::string name, Operation&& operation) -> std::invoke_result_t<Operation&&>
  {
    auto instrumented_span = start_span(std::move(name), span_kind::internal);
    auto binding = execution_context::current()->bind(instrumented_span);
    detail::span_closer closer{ instrumented_span };
    try {
      return std::forward<Operation>(operation)();
    } catch (const std::exception& e) {
      instrumented_span->set_status(span_status::error(e.what()));
      throw;
    } catch (...) {
      instrumented_span->set_status(span_status::error("unknown exception"));
      throw;
    }
  }

  [[nodiscard]] auto options() const -> const tracing_options::built&
  {
    return options_;
  }

  [[nodiscard]] auto sampler() const -> const std::shared_ptr<tinytrace::sampler>&
  {
    return sampler_;
  }

  [[nodiscard]] auto exporter() const -> const std::shared_ptr<span_exporter>&
  {
    return exporter_;
  }

  /**
   * Attributes describing this process (service.name, service.instance.id, ...).
   */
  [[nodiscard]] auto resource() const -> const attribute_map&
  {
    return resource_;
  }

private:
  tracing_options::built options_;
  std::shared_ptr<tinytrace::sampler> sampler_;
  std::shared_ptr<span_exporter> exporter_;
  attribute_map resource_;
};

/**
 * Resource attributes for a process configured with the given options. Every call generates a
 * new service.instance.id.
 */
auto
make_resource(const tracing_options::built& options) -> attribute_map;
} // namespace tinytrace
