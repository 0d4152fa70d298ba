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

#include "usage_error.hxx"

#include "core/logger/logger.hxx"

#include <tinytrace/build_config.hxx>

#include <gsl/assert>

#include <string_view>

namespace tinytrace::core::tracing
{
void
report_usage_error(std::string_view message)
{
  TT_LOG_ERROR("tracing API misuse: {}", message);
#if TINYTRACE_DEBUG_BUILD
  logger::flush();
  Expects(false);
#endif
}
} // namespace tinytrace::core::tracing
