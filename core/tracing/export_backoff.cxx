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

#include "export_backoff.hxx"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace tinytrace::core::tracing
{
auto
exponential_backoff(std::chrono::milliseconds min_backoff,
                    std::chrono::milliseconds max_backoff,
                    double backoff_factor) -> backoff_calculator
{
  double min = 1;   // 1 millisecond
  double max = 500; // 500 milliseconds
  double factor = 2;

  if (min_backoff > std::chrono::milliseconds::zero()) {
    min = static_cast<double>(min_backoff.count());
  }
  if (max_backoff > std::chrono::milliseconds::zero()) {
    max = static_cast<double>(max_backoff.count());
  }
  if (backoff_factor > 0) {
    factor = backoff_factor;
  }

  return [min, max, factor](std::size_t failed_attempts) {
    auto exponent = failed_attempts > 0 ? static_cast<double>(failed_attempts - 1) : 0.0;
    double backoff = min * std::pow(factor, exponent);
    if (backoff > max) {
      backoff = max;
    }
    if (backoff < min) {
      backoff = min;
    }
    return std::chrono::milliseconds(static_cast<std::uint64_t>(backoff));
  };
}
} // namespace tinytrace::core::tracing
