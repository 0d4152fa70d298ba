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

#include "string_hex.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace
{
inline auto
from_lower_hex_digit(char c) -> std::optional<std::uint8_t>
{
  if ('0' <= c && c <= '9') {
    return static_cast<std::uint8_t>(c - '0');
  }
  if ('a' <= c && c <= 'f') {
    return static_cast<std::uint8_t>(c + 10 - 'a');
  }
  return {};
}
} // namespace

auto
tinytrace::core::to_hex_digits(std::uint64_t value, std::size_t width) -> std::string
{
  static constexpr char digits[] = "0123456789abcdef";
  std::string ret(width, '0');
  for (std::size_t i = width; i > 0 && value != 0; --i) {
    ret[i - 1] = digits[value & 0x0fU];
    value >>= 4U;
  }
  return ret;
}

auto
tinytrace::core::parse_lower_hex(std::string_view buffer) -> std::optional<std::uint64_t>
{
  if (buffer.empty() || buffer.size() > 16) {
    return {};
  }

  std::uint64_t ret = 0;
  for (const char digit : buffer) {
    auto nibble = from_lower_hex_digit(digit);
    if (!nibble) {
      return {};
    }
    ret = (ret << 4U) | nibble.value();
  }
  return ret;
}
