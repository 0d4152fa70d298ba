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

#include <array>
#include <cstdint>
#include <string>

namespace tinytrace::core::uuid
{
using uuid_t = std::array<std::uint8_t, 16>;

/** Get a new random v4 uuid */
void
random(uuid_t& uuid);

auto
random() -> uuid_t;

/** Canonical lower-case 8-4-4-4-12 representation */
auto
to_string(const uuid_t& uuid) -> std::string;
} // namespace tinytrace::core::uuid
