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

#include "random.h"

#include <cstdint>
#include <random>

auto
tinytrace::core::random_uint64() -> std::uint64_t
{
  static thread_local std::mt19937_64 gen{ std::random_device()() };
  std::uniform_int_distribution<std::uint64_t> dis;
  return dis(gen);
}

auto
tinytrace::core::random_nonzero_uint64() -> std::uint64_t
{
  std::uint64_t value{ 0 };
  while (value == 0) {
    value = random_uint64();
  }
  return value;
}
