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

#include "export_backoff.hxx"

#include <tinytrace/span_exporter.hxx>
#include <tinytrace/span_transport.hxx>

#include <asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <system_error>

namespace tinytrace::core::tracing
{
struct batching_exporter_options {
  std::size_t batch_max_size{ 512 };
  std::size_t max_queue_size{ 2048 };
  std::chrono::milliseconds flush_interval{ std::chrono::seconds{ 5 } };
  std::size_t max_export_attempts{ 3 };
  backoff_calculator backoff{ exponential_backoff(std::chrono::milliseconds{ 100 },
                                                  std::chrono::seconds{ 5 },
                                                  2.0) };
};

class batching_span_exporter_impl;

/**
 * Exporter that accumulates closed spans in a bounded queue and hands them to the transport in
 * batches, from the given io_context.
 *
 * A batch is sent when the queue reaches batch_max_size, every flush_interval, on flush() and on
 * shutdown(). The queue always holds at least one full batch: a smaller max_queue_size is raised
 * to batch_max_size. Failed sends are retried with back-off up to max_export_attempts in total
 * (encoding failures are not retried), then the batch is dropped and counted.
 */
class batching_span_exporter : public span_exporter
{
public:
  batching_span_exporter(asio::io_context& ctx,
                         std::shared_ptr<span_transport> transport,
                         batching_exporter_options options);
  batching_span_exporter(const batching_span_exporter& other) = delete;
  batching_span_exporter(batching_span_exporter&& other) = delete;
  auto operator=(const batching_span_exporter& other) -> batching_span_exporter& = delete;
  auto operator=(batching_span_exporter&& other) -> batching_span_exporter& = delete;
  ~batching_span_exporter() override;

  void start() override;
  void record(span_data&& span) override;
  void flush() override;
  void shutdown() override;
  [[nodiscard]] auto stats() const -> exporter_stats override;

  /**
   * Same as record(), but tells why the span has been refused.
   *
   * @return errc::tracing::queue_overflow or errc::tracing::exporter_stopped when the span has
   * been dropped
   */
  auto enqueue(span_data&& span) -> std::error_code;

private:
  std::shared_ptr<batching_span_exporter_impl> impl_;
};
} // namespace tinytrace::core::tracing
