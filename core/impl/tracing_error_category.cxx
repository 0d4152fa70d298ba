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

#include <tinytrace/error_codes.hxx>

#include <string>

namespace tinytrace::core::impl
{
struct tracing_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "tinytrace.tracing";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::tracing>(ev)) {
      case errc::tracing::transport_failure:
        return "transport_failure (1)";
      case errc::tracing::connection_refused:
        return "connection_refused (2)";
      case errc::tracing::export_timeout:
        return "export_timeout (3)";
      case errc::tracing::unexpected_status:
        return "unexpected_status (4)";
      case errc::tracing::invalid_endpoint:
        return "invalid_endpoint (5)";
      case errc::tracing::encoding_failure:
        return "encoding_failure (6)";
      case errc::tracing::queue_overflow:
        return "queue_overflow (7)";
      case errc::tracing::exporter_stopped:
        return "exporter_stopped (8)";
    }
    return "FIXME: unknown error code (recompile with newer library): tinytrace.tracing." +
           std::to_string(ev);
  }
};

const inline static tracing_error_category category_instance;

auto
tracing_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace tinytrace::core::impl
