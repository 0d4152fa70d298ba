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

#include "uuid.h"

#include "random.h"

#include <cstddef>
#include <cstdint>
#include <string>

void
tinytrace::core::uuid::random(tinytrace::core::uuid::uuid_t& uuid)
{
  // The uuid is 16 bytes, which is the same as two 64-bit integers
  for (std::size_t half = 0; half < 2; ++half) {
    auto value = random_uint64();
    for (std::size_t i = 0; i < 8; ++i) {
      uuid[half * 8 + i] = static_cast<std::uint8_t>(value >> (56U - 8U * i));
    }
  }

  // Make sure that it looks like a version 4
  uuid[6] &= 0x0f;
  uuid[6] |= 0x40;
  // RFC 4122 variant
  uuid[8] &= 0x3f;
  uuid[8] |= 0x80;
}

auto
tinytrace::core::uuid::random() -> tinytrace::core::uuid::uuid_t
{
  uuid_t ret;
  random(ret);
  return ret;
}

inline auto
to_char(std::uint8_t c) -> char
{
  if (c <= 9) {
    return static_cast<char>('0' + c);
  }
  return static_cast<char>('a' + (c - 10));
}

auto
tinytrace::core::uuid::to_string(const tinytrace::core::uuid::uuid_t& uuid) -> std::string
{
  std::string ret(36, '-');
  std::size_t i = 0;

  for (const auto& byte : uuid) {
    ret[i] = to_char(static_cast<std::uint8_t>(byte >> 4U) & 0x0fU);
    ++i;
    ret[i] = to_char(byte & 0x0fU);
    ++i;
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      ++i;
    }
  }
  return ret;
}
