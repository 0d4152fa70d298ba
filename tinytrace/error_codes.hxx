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

#include <system_error>

namespace tinytrace
{
namespace core::impl
{
auto
tracing_category() noexcept -> const std::error_category&;
} // namespace core::impl

namespace errc
{
/**
 * Errors reported by span transports and the exporter. They never reach request handling code,
 * the exporter converts them into counters and log records.
 */
enum class tracing {
  /**
   * The transport could not deliver the batch (I/O error, malformed response)
   */
  transport_failure = 1,

  /**
   * Unable to resolve or connect to the collector
   */
  connection_refused = 2,

  /**
   * The collector did not answer within the export timeout
   */
  export_timeout = 3,

  /**
   * The collector answered with a non-2xx status code
   */
  unexpected_status = 4,

  /**
   * The export endpoint cannot be parsed as http://host[:port][/path]
   */
  invalid_endpoint = 5,

  /**
   * The batch cannot be encoded for the wire
   */
  encoding_failure = 6,

  /**
   * The exporter queue is full, the span has been dropped
   */
  queue_overflow = 7,

  /**
   * The exporter has been shut down and does not accept spans anymore
   */
  exporter_stopped = 8,
};

inline auto
make_error_code(tracing e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::tracing_category() };
}
} // namespace errc
} // namespace tinytrace

template<>
struct std::is_error_code_enum<tinytrace::errc::tracing> : std::true_type {
};
