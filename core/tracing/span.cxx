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

#include <tinytrace/fmt/span_context.hxx>
#include <tinytrace/span.hxx>
#include <tinytrace/span_exporter.hxx>

#include "core/logger/logger.hxx"
#include "usage_error.hxx"

#include <fmt/core.h>

#include <chrono>
#include <string>
#include <utility>

namespace tinytrace
{
auto
to_string(span_kind kind) -> const char*
{
  switch (kind) {
    case span_kind::internal:
      return "internal";
    case span_kind::server:
      return "server";
    case span_kind::client:
      return "client";
  }
  return "unknown";
}

auto
to_string(status_code code) -> const char*
{
  switch (code) {
    case status_code::unset:
      return "unset";
    case status_code::ok:
      return "ok";
    case status_code::error:
      return "error";
  }
  return "unknown";
}

span::span(std::string name,
           span_kind kind,
           span_context context,
           std::shared_ptr<span_exporter> exporter,
           span_event_detail detail)
  : context_{ context }
  , name_{ std::move(name) }
  , kind_{ kind }
  , exporter_{ std::move(exporter) }
  , detail_{ detail }
{
  if (detail_ == span_event_detail::all) {
    TT_LOG_INFO("new span \"{}\" kind={}, trace_id={}, span_id={}, parent_span_id={}, sampled={}",
                name_,
                kind_,
                context_.trace_id(),
                context_.span_id(),
                context_.parent_span_id() ? context_.parent_span_id()->to_hex() : "-",
                context_.sampled());
  }
}

span::~span()
{
  if (!ended_) {
    TT_LOG_DEBUG("span \"{}\" (trace_id={}, span_id={}) destroyed without end(), not exported",
                 name_,
                 context_.trace_id(),
                 context_.span_id());
  }
}

auto
span::accepts_mutation(const char* operation) const -> bool
{
  if (ended_) {
    core::tracing::report_usage_error(fmt::format("{}() on closed span \"{}\" (span_id={})",
                                                  operation,
                                                  name_,
                                                  context_.span_id()));
    return false;
  }
  return true;
}

void
span::put_attribute(const std::string& key, attribute_value value)
{
  if (!accepts_mutation("set_attribute") || !context_.sampled()) {
    return;
  }
  attributes_.insert_or_assign(key, std::move(value));
}

void
span::set_attribute(const std::string& key, const std::string& value)
{
  put_attribute(key, value);
}

void
span::set_attribute(const std::string& key, const char* value)
{
  put_attribute(key, std::string{ value });
}

void
span::set_attribute(const std::string& key, bool value)
{
  put_attribute(key, value);
}

void
span::set_attribute(const std::string& key, double value)
{
  put_attribute(key, value);
}

void
span::set_attribute(const std::string& key, std::int64_t value)
{
  put_attribute(key, value);
}

void
span::add_event(std::string name, attribute_map attributes)
{
  if (!accepts_mutation("add_event") || !context_.sampled()) {
    return;
  }
  events_.push_back({ std::move(name), std::chrono::system_clock::now(), std::move(attributes) });
}

void
span::set_status(span_status status)
{
  if (!accepts_mutation("set_status")) {
    return;
  }
  status_ = std::move(status);
}

void
span::end()
{
  if (ended_.exchange(true)) {
    core::tracing::report_usage_error(
      fmt::format("end() called more than once for span \"{}\" (span_id={})",
                  name_,
                  context_.span_id()));
    return;
  }
  auto end_time = std::chrono::system_clock::now();

  if (detail_ == span_event_detail::all) {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_monotonic_);
    TT_LOG_INFO("close span \"{}\" trace_id={}, span_id={}, status={}, duration_us={}",
                name_,
                context_.trace_id(),
                context_.span_id(),
                status_.code(),
                duration.count());
  }

  if (!context_.sampled() || exporter_ == nullptr) {
    return;
  }
  exporter_->record(span_data{
    context_,
    name_,
    kind_,
    start_time_,
    end_time,
    std::move(attributes_),
    std::move(events_),
    status_,
  });
}
} // namespace tinytrace
