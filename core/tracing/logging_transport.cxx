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

#include "logging_transport.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"
#include "otlp_json.hxx"

#include <string>
#include <utility>

namespace tinytrace::core::tracing
{
logging_transport::logging_transport(attribute_map resource)
  : resource_{ std::move(resource) }
{
}

auto
logging_transport::send(const std::vector<span_data>& batch) -> std::error_code
{
  if (logger::should_log(logger::level::info)) {
    TT_LOG_INFO("exported {} span(s): {}",
                batch.size(),
                utils::json::generate(otlp::to_export_request(resource_, batch)));
  }
  return {};
}

auto
logging_transport::description() const -> std::string
{
  return "logging";
}
} // namespace tinytrace::core::tracing
