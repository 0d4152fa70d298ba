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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tinytrace::core
{
/**
 * Lower-case hexadecimal representation of the value, left-padded with zeros to @p width digits
 * (no "0x" prefix).
 */
auto
to_hex_digits(std::uint64_t value, std::size_t width = 16) -> std::string;

/**
 * Parses up to 16 lower-case hexadecimal digits. Returns empty optional when the buffer is empty,
 * too long, or contains anything but [0-9a-f].
 */
auto
parse_lower_hex(std::string_view buffer) -> std::optional<std::uint64_t>;
} // namespace tinytrace::core
