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
#include <tinytrace/span_transport.hxx>

#include <string>
#include <system_error>
#include <vector>

namespace tinytrace::core::tracing
{
/**
 * Writes every batch as one OTLP/JSON record to the library log (info level). Used when no
 * collector endpoint is configured.
 */
class logging_transport : public span_transport
{
public:
  explicit logging_transport(attribute_map resource);

  [[nodiscard]] auto send(const std::vector<span_data>& batch) -> std::error_code override;

  [[nodiscard]] auto description() const -> std::string override;

private:
  attribute_map resource_;
};
} // namespace tinytrace::core::tracing
