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

namespace tinytrace::core
{
/**
 * Uniformly distributed 64-bit value from a per-thread generator.
 */
auto
random_uint64() -> std::uint64_t;

/**
 * Same as random_uint64(), but never returns zero (zero is reserved for "invalid" identifiers).
 */
auto
random_nonzero_uint64() -> std::uint64_t;
} // namespace tinytrace::core
