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

#include <cstdint>
#include <memory>
#include <string>

namespace tinytrace
{
class trace_id;

/**
 * Decides whether a new trace is recorded. The decision is made once per trace, at its root, and
 * inherited by all descendants.
 */
class sampler
{
public:
  virtual ~sampler() = default;

  [[nodiscard]] virtual auto decide(const trace_id& trace) const -> bool = 0;

  /**
   * Human-readable description, used in the tracer start-up log.
   */
  [[nodiscard]] virtual auto description() const -> std::string = 0;
};

class always_on_sampler : public sampler
{
public:
  [[nodiscard]] auto decide(const trace_id& trace) const -> bool override;
  [[nodiscard]] auto description() const -> std::string override;
};

class always_off_sampler : public sampler
{
public:
  [[nodiscard]] auto decide(const trace_id& trace) const -> bool override;
  [[nodiscard]] auto description() const -> std::string override;
};

/**
 * Samples a fraction of the traces. The decision is a pure function of the trace id: the top 53
 * bits of its low half are mapped onto [0,1) and compared with the ratio, so every process that
 * sees the same trace id makes the same decision.
 *
 * A ratio <= 0 (or NaN) never samples, a ratio >= 1 always samples.
 */
class ratio_based_sampler : public sampler
{
public:
  explicit ratio_based_sampler(double ratio);

  [[nodiscard]] auto decide(const trace_id& trace) const -> bool override;
  [[nodiscard]] auto description() const -> std::string override;

  [[nodiscard]] auto ratio() const -> double
  {
    return ratio_;
  }

private:
  double ratio_;
  std::uint64_t threshold_;
};

/**
 * Picks always_off for rates <= 0 (and NaN), always_on for rates >= 1, ratio_based otherwise.
 */
auto
make_sampler(double rate) -> std::shared_ptr<sampler>;
} // namespace tinytrace
