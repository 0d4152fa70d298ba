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

#include <tinytrace/sampler.hxx>
#include <tinytrace/span_context.hxx>

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>

namespace tinytrace
{
namespace
{
// 2^53, the number of distinct values a double represents exactly in [0,1)
constexpr std::uint64_t sampling_resolution{ 1ULL << 53U };

auto
threshold_for(double ratio) -> std::uint64_t
{
  if (std::isnan(ratio) || ratio <= 0.0) {
    return 0;
  }
  if (ratio >= 1.0) {
    return sampling_resolution;
  }
  return static_cast<std::uint64_t>(ratio * static_cast<double>(sampling_resolution));
}
} // namespace

auto
always_on_sampler::decide(const trace_id& /* trace */) const -> bool
{
  return true;
}

auto
always_on_sampler::description() const -> std::string
{
  return "always_on";
}

auto
always_off_sampler::decide(const trace_id& /* trace */) const -> bool
{
  return false;
}

auto
always_off_sampler::description() const -> std::string
{
  return "always_off";
}

ratio_based_sampler::ratio_based_sampler(double ratio)
  : ratio_{ std::isnan(ratio) ? 0.0 : ratio }
  , threshold_{ threshold_for(ratio) }
{
}

auto
ratio_based_sampler::decide(const trace_id& trace) const -> bool
{
  return (trace.low() >> 11U) < threshold_;
}

auto
ratio_based_sampler::description() const -> std::string
{
  return fmt::format("ratio_based({})", ratio_);
}

auto
make_sampler(double rate) -> std::shared_ptr<sampler>
{
  if (std::isnan(rate) || rate <= 0.0) {
    return std::make_shared<always_off_sampler>();
  }
  if (rate >= 1.0) {
    return std::make_shared<always_on_sampler>();
  }
  return std::make_shared<ratio_based_sampler>(rate);
}
} // namespace tinytrace
