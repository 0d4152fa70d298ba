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

#include <tinytrace/span_event_detail.hxx>
#include <tinytrace/span_exporter.hxx>
#include <tinytrace/span_transport.hxx>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace tinytrace
{
class tracing_options
{
public:
  static constexpr double default_sample_rate{ 1.0 };
  static constexpr std::size_t default_batch_max_size{ 512 };
  static constexpr std::size_t default_max_queue_size{ 2048 };
  static constexpr std::chrono::milliseconds default_flush_interval{ std::chrono::seconds{ 5 } };
  static constexpr std::size_t default_max_export_attempts{ 3 };
  static constexpr std::chrono::milliseconds default_export_timeout{ std::chrono::seconds{ 10 } };
  static constexpr std::chrono::milliseconds default_export_backoff_min{ 100 };
  static constexpr std::chrono::milliseconds default_export_backoff_max{
    std::chrono::seconds{ 5 }
  };
  static constexpr double default_export_backoff_factor{ 2.0 };
  static constexpr std::chrono::milliseconds default_slow_request_threshold{
    std::chrono::seconds{ 1 }
  };

  auto service_name(std::string name) -> tracing_options&
  {
    service_name_ = std::move(name);
    return *this;
  }

  auto service_version(std::string version) -> tracing_options&
  {
    service_version_ = std::move(version);
    return *this;
  }

  auto environment(std::string environment) -> tracing_options&
  {
    environment_ = std::move(environment);
    return *this;
  }

  /**
   * Fraction of new traces to record, in [0,1]. Incoming traces keep the caller's decision.
   */
  auto sample_rate(double rate) -> tracing_options&
  {
    sample_rate_ = rate;
    return *this;
  }

  /**
   * Collector URL, e.g. "http://otel-collector:4318/v1/traces". When empty, batches are written
   * to the library log.
   */
  auto export_endpoint(std::string endpoint) -> tracing_options&
  {
    export_endpoint_ = std::move(endpoint);
    return *this;
  }

  auto batch_max_size(std::size_t number_of_spans) -> tracing_options&
  {
    batch_max_size_ = number_of_spans;
    return *this;
  }

  /**
   * Capacity of the export queue, never less than batch_max_size.
   */
  auto max_queue_size(std::size_t number_of_spans) -> tracing_options&
  {
    max_queue_size_ = number_of_spans;
    return *this;
  }

  auto flush_interval(std::chrono::milliseconds interval) -> tracing_options&
  {
    flush_interval_ = interval;
    return *this;
  }

  /**
   * Total number of attempts to deliver one batch, including the first one.
   */
  auto max_export_attempts(std::size_t attempts) -> tracing_options&
  {
    max_export_attempts_ = attempts;
    return *this;
  }

  auto export_timeout(std::chrono::milliseconds timeout) -> tracing_options&
  {
    export_timeout_ = timeout;
    return *this;
  }

  auto export_backoff(std::chrono::milliseconds min,
                      std::chrono::milliseconds max,
                      double factor = default_export_backoff_factor) -> tracing_options&
  {
    export_backoff_min_ = min;
    export_backoff_max_ = max;
    export_backoff_factor_ = factor;
    return *this;
  }

  auto span_event_detail(tinytrace::span_event_detail detail) -> tracing_options&
  {
    span_event_detail_ = detail;
    return *this;
  }

  /**
   * Requests slower than this are reported with warning level in the completion log.
   */
  auto slow_request_threshold(std::chrono::milliseconds duration) -> tracing_options&
  {
    slow_request_threshold_ = duration;
    return *this;
  }

  auto include_trace_id_header(bool include) -> tracing_options&
  {
    include_trace_id_header_ = include;
    return *this;
  }

  auto trace_id_header_name(std::string name) -> tracing_options&
  {
    trace_id_header_name_ = std::move(name);
    return *this;
  }

  /**
   * Replaces the transport selected from export_endpoint.
   */
  auto transport(std::shared_ptr<span_transport> custom_transport) -> tracing_options&
  {
    transport_ = std::move(custom_transport);
    return *this;
  }

  /**
   * Replaces the batching exporter altogether.
   */
  auto exporter(std::shared_ptr<span_exporter> custom_exporter) -> tracing_options&
  {
    exporter_ = std::move(custom_exporter);
    return *this;
  }

  struct built {
    std::string service_name;
    std::string service_version;
    std::string environment;
    double sample_rate;
    std::string export_endpoint;
    std::size_t batch_max_size;
    std::size_t max_queue_size;
    std::chrono::milliseconds flush_interval;
    std::size_t max_export_attempts;
    std::chrono::milliseconds export_timeout;
    std::chrono::milliseconds export_backoff_min;
    std::chrono::milliseconds export_backoff_max;
    double export_backoff_factor;
    tinytrace::span_event_detail span_event_detail;
    std::chrono::milliseconds slow_request_threshold;
    bool include_trace_id_header;
    std::string trace_id_header_name;
    std::shared_ptr<span_transport> transport;
    std::shared_ptr<span_exporter> exporter;
  };

  [[nodiscard]] auto build() const -> built
  {
    return {
      service_name_,
      service_version_,
      environment_,
      sample_rate_,
      export_endpoint_,
      batch_max_size_,
      max_queue_size_,
      flush_interval_,
      max_export_attempts_,
      export_timeout_,
      export_backoff_min_,
      export_backoff_max_,
      export_backoff_factor_,
      span_event_detail_,
      slow_request_threshold_,
      include_trace_id_header_,
      trace_id_header_name_,
      transport_,
      exporter_,
    };
  }

private:
  std::string service_name_{ "unknown_service" };
  std::string service_version_{ "0.0.0" };
  std::string environment_{ "development" };
  double sample_rate_{ default_sample_rate };
  std::string export_endpoint_{};
  std::size_t batch_max_size_{ default_batch_max_size };
  std::size_t max_queue_size_{ default_max_queue_size };
  std::chrono::milliseconds flush_interval_{ default_flush_interval };
  std::size_t max_export_attempts_{ default_max_export_attempts };
  std::chrono::milliseconds export_timeout_{ default_export_timeout };
  std::chrono::milliseconds export_backoff_min_{ default_export_backoff_min };
  std::chrono::milliseconds export_backoff_max_{ default_export_backoff_max };
  double export_backoff_factor_{ default_export_backoff_factor };
  tinytrace::span_event_detail span_event_detail_{ tinytrace::span_event_detail::none };
  std::chrono::milliseconds slow_request_threshold_{ default_slow_request_threshold };
  bool include_trace_id_header_{ true };
  std::string trace_id_header_name_{ "x-trace-id" };
  std::shared_ptr<span_transport> transport_{};
  std::shared_ptr<span_exporter> exporter_{};
};
} // namespace tinytrace
