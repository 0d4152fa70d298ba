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

#include "test_helper.hxx"

#include <tinytrace/build_config.hxx>
#include <tinytrace/sampler.hxx>
#include <tinytrace/span.hxx>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace
{
auto
make_span(const std::shared_ptr<test::utils::recording_exporter>& exporter,
          bool sampled,
          std::string name = "operation") -> std::shared_ptr<tinytrace::span>
{
  tinytrace::always_on_sampler on{};
  tinytrace::always_off_sampler off{};
  auto context = sampled ? tinytrace::span_context::generate_root(on)
                         : tinytrace::span_context::generate_root(off);
  return std::make_shared<tinytrace::span>(
    std::move(name), tinytrace::span_kind::internal, context, exporter);
}
} // namespace

TEST_CASE("unit: sampled span is exported once when ended", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();

  auto span = make_span(exporter, true, "load user");
  REQUIRE(span->is_recording());
  REQUIRE_FALSE(span->has_ended());

  span->set_attribute("user.id", 42);
  span->set_attribute("cache.hit", false);
  span->set_attribute("db.system", "postgresql");
  span->set_attribute("ratio", 0.75);
  span->set_attribute("user.id", std::string{ "42" });
  span->add_event("cache miss", { { "key", std::string{ "user:42" } } });
  span->set_status(tinytrace::span_status::error("first"));
  span->set_status(tinytrace::span_status::ok());
  REQUIRE(exporter->size() == 0);

  span->end();
  REQUIRE(span->has_ended());
  REQUIRE_FALSE(span->is_recording());
  REQUIRE(exporter->size() == 1);

  auto record = exporter->spans().front();
  REQUIRE(record.name == "load user");
  REQUIRE(record.kind == tinytrace::span_kind::internal);
  REQUIRE(record.context.trace_id() == span->context().trace_id());
  REQUIRE(record.context.span_id() == span->context().span_id());
  REQUIRE(record.end_time >= record.start_time);
  REQUIRE(record.start_time == span->start_time());

  REQUIRE(record.attributes.size() == 4);
  REQUIRE(std::get<std::string>(record.attributes.at("user.id")) == "42");
  REQUIRE(std::get<bool>(record.attributes.at("cache.hit")) == false);
  REQUIRE(std::get<std::string>(record.attributes.at("db.system")) == "postgresql");
  REQUIRE(std::get<double>(record.attributes.at("ratio")) == 0.75);

  REQUIRE(record.events.size() == 1);
  REQUIRE(record.events.front().name == "cache miss");
  REQUIRE(record.events.front().timestamp >= record.start_time);

  REQUIRE(record.status.code() == tinytrace::status_code::ok);
}

TEST_CASE("unit: integral attributes are stored as 64-bit integers", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();

  auto span = make_span(exporter, true);
  span->set_attribute("int", 7);
  span->set_attribute("unsigned", 8U);
  span->set_attribute("size", std::size_t{ 9 });
  span->end();

  auto record = exporter->spans().front();
  REQUIRE(std::get<std::int64_t>(record.attributes.at("int")) == 7);
  REQUIRE(std::get<std::int64_t>(record.attributes.at("unsigned")) == 8);
  REQUIRE(std::get<std::int64_t>(record.attributes.at("size")) == 9);
}

TEST_CASE("unit: unsampled span is never exported", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();

  auto span = make_span(exporter, false);
  REQUIRE_FALSE(span->is_recording());
  REQUIRE(span->context().is_valid());

  span->set_attribute("ignored", true);
  span->add_event("ignored");
  span->set_status(tinytrace::span_status::error("still tracked"));
  span->end();

  REQUIRE(span->has_ended());
  REQUIRE(span->status().code() == tinytrace::status_code::error);
  REQUIRE(exporter->size() == 0);
}

TEST_CASE("unit: span without exporter can be ended", "[unit]")
{
  test::utils::init_logger();
  tinytrace::always_on_sampler sampler{};
  tinytrace::span span{
    "detached", tinytrace::span_kind::client, tinytrace::span_context::generate_root(sampler), nullptr
  };
  span.end();
  REQUIRE(span.has_ended());
  REQUIRE(span.kind() == tinytrace::span_kind::client);
}

TEST_CASE("unit: span kinds and status codes have names", "[unit]")
{
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::span_kind::internal) } == "internal");
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::span_kind::server) } == "server");
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::span_kind::client) } == "client");
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::status_code::unset) } == "unset");
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::status_code::ok) } == "ok");
  REQUIRE(std::string{ tinytrace::to_string(tinytrace::status_code::error) } == "error");

  REQUIRE(tinytrace::span_status{}.code() == tinytrace::status_code::unset);
  REQUIRE(tinytrace::span_status::error("boom").message() == "boom");
}

#if !TINYTRACE_DEBUG_BUILD
// misuse is fatal in debug builds
TEST_CASE("unit: closed span ignores further mutations", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();

  auto span = make_span(exporter, true);
  span->set_status(tinytrace::span_status::ok());
  span->end();

  span->set_attribute("late", true);
  span->add_event("late");
  span->set_status(tinytrace::span_status::error("late"));
  span->end();

  REQUIRE(exporter->size() == 1);
  REQUIRE(exporter->spans().front().attributes.empty());
  REQUIRE(span->status().code() == tinytrace::status_code::ok);
}
#endif
