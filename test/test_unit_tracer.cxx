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
#include "utils/log_capture.hxx"

#include <tinytrace/build_config.hxx>
#include <tinytrace/tracer.hxx>

#include "core/tracing/batching_span_exporter.hxx"

#include <asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

using namespace std::literals::chrono_literals;

TEST_CASE("unit: tracer options defaults", "[unit]")
{
  auto options = tinytrace::tracing_options{}.build();
  REQUIRE(options.service_name == "unknown_service");
  REQUIRE(options.sample_rate == 1.0);
  REQUIRE(options.export_endpoint.empty());
  REQUIRE(options.batch_max_size == 512);
  REQUIRE(options.max_queue_size == 2048);
  REQUIRE(options.flush_interval == 5s);
  REQUIRE(options.max_export_attempts == 3);
  REQUIRE(options.span_event_detail == tinytrace::span_event_detail::none);
  REQUIRE(options.include_trace_id_header);
  REQUIRE(options.trace_id_header_name == "x-trace-id");
  REQUIRE(options.transport == nullptr);
  REQUIRE(options.exporter == nullptr);
}

TEST_CASE("unit: resource describes the process", "[unit]")
{
  auto options = tinytrace::tracing_options{}
                   .service_name("checkout")
                   .service_version("1.4.2")
                   .environment("staging")
                   .build();
  auto resource = tinytrace::make_resource(options);

  REQUIRE(std::get<std::string>(resource.at("service.name")) == "checkout");
  REQUIRE(std::get<std::string>(resource.at("service.version")) == "1.4.2");
  REQUIRE(std::get<std::string>(resource.at("deployment.environment")) == "staging");
  REQUIRE(std::get<std::string>(resource.at("telemetry.sdk.name")) == "tinytrace");
  REQUIRE(std::get<std::string>(resource.at("telemetry.sdk.language")) == "cpp");
  REQUIRE(std::get<std::string>(resource.at("telemetry.sdk.version")) == TINYTRACE_VERSION_STRING);

  auto instance = std::get<std::string>(resource.at("service.instance.id"));
  REQUIRE(instance.size() == 36);
  REQUIRE(instance != std::get<std::string>(tinytrace::make_resource(options).at("service.instance.id")));
}

TEST_CASE("unit: instrumented operation runs inside its own span", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();
  auto tracer = std::make_shared<tinytrace::tracer>(tinytrace::tracing_options{}.build(), exporter);

  auto answer = tracer->instrumented("compute", [&tracer]() {
    auto current = tinytrace::execution_context::current_span();
    REQUIRE(current != nullptr);
    REQUIRE(current->name() == "compute");
    auto inner = tracer->start_span("inner");
    REQUIRE(inner->context().parent_span_id() == current->context().span_id());
    inner->end();
    return 42;
  });
  REQUIRE(answer == 42);
  REQUIRE(tinytrace::execution_context::current_span() == nullptr);
  REQUIRE(exporter->size() == 2);
  REQUIRE(exporter->find("compute")->status.code() == tinytrace::status_code::unset);

  SECTION("exception marks span as failed")
  {
    REQUIRE_THROWS_AS(tracer->instrumented("explode",
                                           []() {
                                             throw std::runtime_error("disk full");
                                           }),
                      std::runtime_error);
    auto failed = exporter->find("explode");
    REQUIRE(failed.has_value());
    REQUIRE(failed->status.code() == tinytrace::status_code::error);
    REQUIRE(failed->status.message() == "disk full");
    REQUIRE(tinytrace::execution_context::current_span() == nullptr);
  }

  SECTION("explicit status is kept")
  {
    tracer->instrumented("explicit", []() {
      tinytrace::execution_context::current_span()->set_status(tinytrace::span_status::ok());
    });
    REQUIRE(exporter->find("explicit")->status.code() == tinytrace::status_code::ok);
  }
}

TEST_CASE("unit: unsampled traces are propagated but not exported", "[unit]")
{
  test::utils::init_logger();
  auto exporter = std::make_shared<test::utils::recording_exporter>();
  auto tracer =
    std::make_shared<tinytrace::tracer>(tinytrace::tracing_options{}.sample_rate(0.0).build(), exporter);
  REQUIRE(tracer->sampler()->description() == "always_off");

  auto root = tracer->start_span("root", tinytrace::span_kind::server);
  REQUIRE(root->context().is_valid());
  REQUIRE_FALSE(root->context().sampled());

  auto child = tracer->start_span("child", tinytrace::span_kind::internal, root->context());
  REQUIRE(child->context().trace_id() == root->context().trace_id());
  REQUIRE_FALSE(child->context().sampled());

  child->end();
  root->end();
  REQUIRE(exporter->size() == 0);

  SECTION("remote sampled parent overrides local rate")
  {
    tinytrace::span_context remote{ tinytrace::trace_id::random(), tinytrace::span_id::random(), {}, true };
    auto continued = tracer->start_span("continued", tinytrace::span_kind::server, remote);
    REQUIRE(continued->context().sampled());
    continued->end();
    REQUIRE(exporter->size() == 1);
  }
}

TEST_CASE("unit: tracer uses custom exporter", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io{};
  auto exporter = std::make_shared<test::utils::recording_exporter>();
  auto tracer = tinytrace::tracer::create(io, tinytrace::tracing_options{}.exporter(exporter));
  REQUIRE(tracer->exporter() == exporter);

  tracer->start();
  tracer->start_span("span")->end();
  tracer->stop();
  REQUIRE(exporter->size() == 1);
  REQUIRE(exporter->is_shutdown());
}

TEST_CASE("unit: tracer delivers spans through the transport on stop", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io{};
  auto transport = std::make_shared<test::utils::scripted_transport>();
  auto tracer = tinytrace::tracer::create(
    io, tinytrace::tracing_options{}.service_name("billing").transport(transport).batch_max_size(100));
  REQUIRE(std::dynamic_pointer_cast<tinytrace::core::tracing::batching_span_exporter>(
            tracer->exporter()) != nullptr);

  tracer->start();
  for (int i = 0; i < 10; ++i) {
    tracer->start_span("work")->end();
  }
  REQUIRE(transport->calls() == 0);

  tracer->stop();
  REQUIRE(transport->calls() == 1);
  REQUIRE(transport->batches().front().size() == 10);
  REQUIRE(tracer->exporter()->stats().exported == 10);

  tracer->start_span("too late")->end();
  REQUIRE(tracer->exporter()->stats().dropped_after_shutdown == 1);
}

TEST_CASE("unit: tracer without endpoint writes spans to the log", "[unit]")
{
  asio::io_context io{};
  test::utils::log_capture capture{ tinytrace::core::logger::level::info };
  auto tracer = tinytrace::tracer::create(io, tinytrace::tracing_options{}.service_name("logged"));

  tracer->start();
  REQUIRE(capture.contains("tracer started: service=logged"));
  tracer->start_span("visible in log")->end();
  tracer->flush();
  REQUIRE(capture.contains("exported 1 span(s)"));
  REQUIRE(capture.contains("visible in log"));
  tracer->stop();
  REQUIRE(capture.contains("tracer stopped: exported=1"));
}

TEST_CASE("unit: span lifecycle is logged when requested", "[unit]")
{
  test::utils::log_capture capture{ tinytrace::core::logger::level::info };
  auto exporter = std::make_shared<test::utils::recording_exporter>();
  auto make_tracer = [&exporter](tinytrace::span_event_detail detail) {
    return std::make_shared<tinytrace::tracer>(
      tinytrace::tracing_options{}.span_event_detail(detail).build(), exporter);
  };

  SECTION("all")
  {
    make_tracer(tinytrace::span_event_detail::all)->instrumented("audited", []() {
    });
    REQUIRE(capture.count("new span \"audited\"") == 1);
    REQUIRE(capture.count("enter span \"audited\"") == 1);
    REQUIRE(capture.count("exit span \"audited\"") == 1);
    REQUIRE(capture.count("close span \"audited\"") == 1);
  }

  SECTION("enter_exit")
  {
    make_tracer(tinytrace::span_event_detail::enter_exit)->instrumented("bound", []() {
    });
    REQUIRE(capture.count("enter span \"bound\"") == 1);
    REQUIRE(capture.count("exit span \"bound\"") == 1);
    REQUIRE_FALSE(capture.contains("new span"));
    REQUIRE_FALSE(capture.contains("close span"));
  }

  SECTION("none")
  {
    make_tracer(tinytrace::span_event_detail::none)->instrumented("quiet", []() {
    });
    REQUIRE_FALSE(capture.contains("quiet"));
    REQUIRE(exporter->find("quiet").has_value());
  }
}
