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

namespace tinytrace
{
/**
 * Amount of span lifecycle information written to the library log.
 */
enum class span_event_detail {
  /** spans produce no log records */
  none,
  /** a record when a span is bound to an execution context, and when the binding is released */
  enter_exit,
  /** enter_exit, plus records when a span is created and closed (with its duration) */
  all,
};
} // namespace tinytrace
