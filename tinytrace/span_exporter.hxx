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

#include <cstdint>

namespace tinytrace
{
/**
 * Counters reported by span exporters.
 */
struct exporter_stats {
  /** spans accepted into the queue */
  std::uint64_t recorded{ 0 };
  /** spans delivered by the transport */
  std::uint64_t exported{ 0 };
  /** spans refused because the queue was full */
  std::uint64_t dropped_on_overflow{ 0 };
  /** spans of batches that failed every export attempt */
  std::uint64_t dropped_on_failure{ 0 };
  /** spans recorded after shutdown() */
  std::uint64_t dropped_after_shutdown{ 0 };
  /** batches that failed every export attempt */
  std::uint64_t failed_batches{ 0 };
  /** calls to span_transport::send(), including retries */
  std::uint64_t export_attempts{ 0 };
};

/**
 * Receives closed sampled spans and delivers them out of the request path.
 *
 * Implementations must be safe to call from any thread. Delivery errors are never reported to the
 * caller of record().
 */
class span_exporter
{
public:
  span_exporter() = default;
  span_exporter(const span_exporter& other) = delete;
  span_exporter(span_exporter&& other) = delete;
  auto operator=(const span_exporter& other) -> span_exporter& = delete;
  auto operator=(span_exporter&& other) -> span_exporter& = delete;
  virtual ~span_exporter() = default;

  /**
   * Starts background activity (periodic flushes), if any.
   */
  virtual void start()
  {
  }

  /**
   * Takes ownership of a closed span record. Never blocks on I/O.
   */
  virtual void record(span_data&& span) = 0;

  /**
   * Delivers everything recorded so far before returning.
   */
  virtual void flush() = 0;

  /**
   * Stops background activity and delivers remaining spans. Spans recorded afterwards are dropped.
   */
  virtual void shutdown() = 0;

  [[nodiscard]] virtual auto stats() const -> exporter_stats = 0;
};
} // namespace tinytrace
