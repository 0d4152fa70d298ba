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

#include <tinytrace/span_context.hxx>
#include <tinytrace/span_data.hxx>
#include <tinytrace/span_event_detail.hxx>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace tinytrace
{
class span_exporter;

/**
 * A timed operation within a trace.
 *
 * A span is created open by the tracer and is mutated only by the execution context that owns it
 * (and its direct children), never concurrently. end() closes it exactly once. A sampled span
 * hands its record over to the exporter on end(), after which only its identity (context, name
 * and kind) remains readable.
 *
 * Attributes and events of unsampled spans are discarded. Mutating a closed span is a usage
 * error: it is logged, fatal in debug builds and ignored otherwise.
 */
class span
{
public:
  span(std::string name,
       span_kind kind,
       span_context context,
       std::shared_ptr<span_exporter> exporter,
       span_event_detail detail = span_event_detail::none);
  span(const span& other) = delete;
  span(span&& other) = delete;
  auto operator=(const span& other) -> span& = delete;
  auto operator=(span&& other) -> span& = delete;
  ~span();

  [[nodiscard]] auto context() const -> const span_context&
  {
    return context_;
  }

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto kind() const -> span_kind
  {
    return kind_;
  }

  [[nodiscard]] auto start_time() const -> std::chrono::system_clock::time_point
  {
    return start_time_;
  }

  [[nodiscard]] auto event_detail() const -> span_event_detail
  {
    return detail_;
  }

  [[nodiscard]] auto has_ended() const -> bool
  {
    return ended_;
  }

  /**
   * @return true while the span is open and sampled, i.e. when attributes and events are kept
   */
  [[nodiscard]] auto is_recording() const -> bool
  {
    return context_.sampled() && !ended_;
  }

  [[nodiscard]] auto status() const -> const span_status&
  {
    return status_;
  }

  void set_attribute(const std::string& key, const std::string& value);
  void set_attribute(const std::string& key, const char* value);
  void set_attribute(const std::string& key, bool value);
  void set_attribute(const std::string& key, double value);
  void set_attribute(const std::string& key, std::int64_t value);

  template<typename Integer,
           std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool> &&
                              !std::is_same_v<Integer, std::int64_t>,
                            int> = 0>
  void set_attribute(const std::string& key, Integer value)
  {
    set_attribute(key, static_cast<std::int64_t>(value));
  }

  void add_event(std::string name, attribute_map attributes = {});

  /**
   * Last call wins.
   */
  void set_status(span_status status);

  /**
   * Records the end time and hands a sampled span over to the exporter.
   */
  void end();

private:
  void put_attribute(const std::string& key, attribute_value value);
  [[nodiscard]] auto accepts_mutation(const char* operation) const -> bool;

  span_context context_;
  std::string name_;
  span_kind kind_;
  std::shared_ptr<span_exporter> exporter_;
  span_event_detail detail_;
  std::chrono::system_clock::time_point start_time_{ std::chrono::system_clock::now() };
  std::chrono::steady_clock::time_point start_monotonic_{ std::chrono::steady_clock::now() };
  attribute_map attributes_{};
  std::vector<span_event> events_{};
  span_status status_{};
  std::atomic_bool ended_{ false };
};
} // namespace tinytrace
