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

#include <string_view>

namespace tinytrace::core::tracing
{
/**
 * Reports misuse of the tracing API (mutating a closed span, closing it twice, releasing bindings
 * out of order). The message is logged at error level. Debug builds terminate through a GSL
 * contract violation, release builds continue and the caller ignores the offending operation.
 */
void
report_usage_error(std::string_view message);
} // namespace tinytrace::core::tracing
