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

#include <tinytrace/tracer.hxx>

#include "batching_span_exporter.hxx"
#include "constants.hxx"
#include "core/logger/logger.hxx"
#include "core/platform/uuid.h"
#include "export_backoff.hxx"
#include "logging_transport.hxx"
#include "otlp_http_transport.hxx"

#include <tinytrace/build_config.hxx>

#include <asio/io_context.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tinytrace
{
auto
make_resource(const tracing_options::built& options) -> attribute_map
{
  using namespace core::tracing;
  return {
    { resource::service_name, options.service_name },
    { resource::service_version, options.service_version },
    { resource::deployment_environment, options.environment },
    { resource::service_instance_id, core::uuid::to_string(core::uuid::random()) },
    { resource::telemetry_sdk_name, std::string{ TINYTRACE_SDK_NAME } },
    { resource::telemetry_sdk_language, std::string{ "cpp" } },
    { resource::telemetry_sdk_version, std::string{ TINYTRACE_VERSION_STRING } },
  };
}

auto
tracer::create(asio::io_context& ctx, const tracing_options& options) -> std::shared_ptr<tracer>
{
  auto built = options.build();
  auto resource = make_resource(built);

  auto exporter = built.exporter;
  if (!exporter) {
    auto transport = built.transport;
    if (!transport) {
      if (built.export_endpoint.empty()) {
        transport = std::make_shared<core::tracing::logging_transport>(resource);
      } else {
        transport = std::make_shared<core::tracing::otlp_http_transport>(
          built.export_endpoint, resource, built.export_timeout);
      }
    }
    core::tracing::batching_exporter_options exporter_options{};
    exporter_options.batch_max_size = built.batch_max_size;
    exporter_options.max_queue_size = built.max_queue_size;
    exporter_options.flush_interval = built.flush_interval;
    exporter_options.max_export_attempts = built.max_export_attempts;
    exporter_options.backoff = core::tracing::exponential_backoff(
      built.export_backoff_min, built.export_backoff_max, built.export_backoff_factor);
    exporter = std::make_shared<core::tracing::batching_span_exporter>(
      ctx, std::move(transport), std::move(exporter_options));
  }

  return std::make_shared<tracer>(std::move(built), std::move(exporter), std::move(resource));
}

tracer::tracer(tracing_options::built options,
               std::shared_ptr<span_exporter> exporter,
               attribute_map resource)
  : options_{ std::move(options) }
  , sampler_{ make_sampler(options_.sample_rate) }
  , exporter_{ std::move(exporter) }
  , resource_{ resource.empty() ? make_resource(options_) : std::move(resource) }
{
}

void
tracer::start()
{
  if (exporter_) {
    exporter_->start();
  }
  TT_LOG_INFO("tracer started: service={}, version={}, environment={}, sampler={}, endpoint=\"{}\"",
              options_.service_name,
              options_.service_version,
              options_.environment,
              sampler_->description(),
              options_.export_endpoint);
}

void
tracer::stop()
{
  if (!exporter_) {
    return;
  }
  exporter_->shutdown();
  auto stats = exporter_->stats();
  TT_LOG_INFO("tracer stopped: exported={}, dropped_on_overflow={}, dropped_on_failure={}",
              stats.exported,
              stats.dropped_on_overflow,
              stats.dropped_on_failure);
}

void
tracer::flush()
{
  if (exporter_) {
    exporter_->flush();
  }
}

auto
tracer::start_span(std::string name, span_kind kind, std::optional<span_context> parent)
  -> std::shared_ptr<span>
{
  auto context = parent ? span_context::derive_child(parent.value())
                        : span_context::generate_root(*sampler_);
  return std::make_shared<span>(
    std::move(name), kind, context, exporter_, options_.span_event_detail);
}

auto
tracer::start_span(std::string name, span_kind kind) -> std::shared_ptr<span>
{
  std::optional<span_context> parent{};
  if (auto current = execution_context::current_span(); current) {
    parent = current->context();
  }
  return start_span(std::move(name), kind, parent);
}
} // namespace tinytrace
