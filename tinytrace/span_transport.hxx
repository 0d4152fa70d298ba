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

#include <string>
#include <system_error>
#include <vector>

namespace tinytrace
{
/**
 * Wire-level delivery of one batch of spans to a collector.
 *
 * send() is called from the exporter's background context, one batch at a time. It returns an
 * error code from the tinytrace.tracing category (or a system error) when the batch has not been
 * accepted, in which case the exporter may call send() again with the same batch.
 */
class span_transport
{
public:
  span_transport() = default;
  span_transport(const span_transport& other) = delete;
  span_transport(span_transport&& other) = delete;
  auto operator=(const span_transport& other) -> span_transport& = delete;
  auto operator=(span_transport&& other) -> span_transport& = delete;
  virtual ~span_transport() = default;

  [[nodiscard]] virtual auto send(const std::vector<span_data>& batch) -> std::error_code = 0;

  [[nodiscard]] virtual auto description() const -> std::string = 0;
};
} // namespace tinytrace
