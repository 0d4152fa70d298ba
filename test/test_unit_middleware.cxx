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
#include <tinytrace/tracing_middleware.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

using namespace std::literals::chrono_literals;

namespace
{
struct fixture {
  std::shared_ptr<test::utils::recording_exporter> exporter{
    std::make_shared<test::utils::recording_exporter>()
  };
  std::shared_ptr<tinytrace::tracer> tracer;
  tinytrace::tracing_middleware middleware;

  explicit fixture(tinytrace::tracing_options options = {})
    : tracer{ std::make_shared<tinytrace::tracer>(options.service_name("checkout").build(), exporter) }
    , middleware{ tracer }
  {
    test::utils::init_logger();
  }
};

auto
string_attribute(const tinytrace::span_data& span, const std::string& key) -> std::string
{
  return std::get<std::string>(span.attributes.at(key));
}

auto
int_attribute(const tinytrace::span_data& span, const std::string& key) -> std::int64_t
{
  return std::get<std::int64_t>(span.attributes.at(key));
}

auto
get_user_request() -> tinytrace::inbound_request
{
  return { "GET", "/users/{id}", "/users/42?verbose=1", { { "User-Agent", "curl/8.5.0" } } };
}
} // namespace

TEST_CASE("unit: request produces linked server and child spans", "[unit]")
{
  fixture f{};

  auto response = f.middleware.handle(get_user_request(), [&f](const tinytrace::inbound_request&) {
    auto query = f.tracer->start_span("SELECT users");
    query->set_attribute("db.system", "postgresql");
    query->end();
    return tinytrace::outbound_response{ 200, {}, R"({"id":42})" };
  });

  REQUIRE(f.exporter->size() == 2);
  auto server = f.exporter->find("GET /users/{id}");
  auto child = f.exporter->find("SELECT users");
  REQUIRE(server.has_value());
  REQUIRE(child.has_value());

  REQUIRE(server->kind == tinytrace::span_kind::server);
  REQUIRE_FALSE(server->context.parent_span_id().has_value());
  REQUIRE(child->kind == tinytrace::span_kind::internal);
  REQUIRE(child->context.trace_id() == server->context.trace_id());
  REQUIRE(child->context.parent_span_id() == server->context.span_id());

  REQUIRE(string_attribute(*server, "http.request.method") == "GET");
  REQUIRE(string_attribute(*server, "http.route") == "/users/{id}");
  REQUIRE(string_attribute(*server, "url.path") == "/users/42?verbose=1");
  REQUIRE(string_attribute(*server, "user_agent.original") == "curl/8.5.0");
  REQUIRE(string_attribute(*server, "service.name") == "checkout");
  REQUIRE(string_attribute(*server, "request.id").size() == 36);
  REQUIRE(int_attribute(*server, "http.response.status_code") == 200);
  REQUIRE(server->status.code() == tinytrace::status_code::ok);

  REQUIRE(response.headers["x-trace-id"] == server->context.trace_id().to_hex());
  REQUIRE(response.body == R"({"id":42})");
}

TEST_CASE("unit: request continues trace of the caller", "[unit]")
{
  fixture f{};
  auto request = get_user_request();
  request.headers["traceparent"] = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";

  auto scope = f.middleware.begin(request);
  REQUIRE(scope.span()->context().trace_id().to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
  REQUIRE(scope.span()->context().parent_span_id()->to_hex() == "00f067aa0ba902b7");
  REQUIRE(scope.span()->context().span_id().to_hex() != "00f067aa0ba902b7");
  scope.complete(200);

  auto server = f.exporter->spans().front();
  REQUIRE(server.context.trace_id().to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
  REQUIRE(server.context.parent_span_id()->to_hex() == "00f067aa0ba902b7");

  SECTION("caller decided not to sample")
  {
    request.headers["traceparent"] = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00";
    auto unsampled = f.middleware.begin(request);
    REQUIRE_FALSE(unsampled.span()->context().sampled());
    unsampled.complete(200);
    REQUIRE(f.exporter->size() == 1);
  }

  SECTION("malformed header starts a new trace")
  {
    request.headers["traceparent"] = "00-4BF92F3577B34DA6A3CE929D0E0E4736-00F067AA0BA902B7-01";
    auto fresh = f.middleware.begin(request);
    REQUIRE(fresh.span()->context().trace_id().to_hex() != "4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE_FALSE(fresh.span()->context().parent_span_id().has_value());
    fresh.complete(200);
  }
}

TEST_CASE("unit: response status decides span status", "[unit]")
{
  fixture f{};

  SECTION("server error")
  {
    test::utils::log_capture capture{};
    auto response = f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
      return tinytrace::outbound_response{ 503 };
    });
    REQUIRE(response.status_code == 503);
    auto server = f.exporter->spans().front();
    REQUIRE(server.status.code() == tinytrace::status_code::error);
    REQUIRE(server.status.message() == "HTTP 503");
    REQUIRE(int_attribute(server, "http.response.status_code") == 503);
    REQUIRE(capture.contains("request failed: request_id="));
  }

  SECTION("client error")
  {
    test::utils::log_capture capture{};
    f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
      return tinytrace::outbound_response{ 404 };
    });
    auto server = f.exporter->spans().front();
    REQUIRE(server.status.code() == tinytrace::status_code::ok);
    REQUIRE(capture.contains("request completed with client error"));
  }

  SECTION("success")
  {
    test::utils::log_capture capture{};
    f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
      return tinytrace::outbound_response{ 201 };
    });
    REQUIRE(capture.count("request completed: request_id=") == 1);
    REQUIRE(capture.contains("GET /users/42?verbose=1, status=201"));
  }
}

TEST_CASE("unit: slow requests are reported", "[unit]")
{
  fixture f{ tinytrace::tracing_options{}.slow_request_threshold(0ms) };
  test::utils::log_capture capture{};
  f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
    return tinytrace::outbound_response{};
  });
  REQUIRE(capture.contains("slow request completed"));
}

TEST_CASE("unit: handler exception closes span with error and propagates", "[unit]")
{
  fixture f{};

  REQUIRE_THROWS_AS(f.middleware.handle(get_user_request(),
                                        [&f](const tinytrace::inbound_request&)
                                          -> tinytrace::outbound_response {
                                          auto step = f.tracer->start_span("validate");
                                          step->end();
                                          throw std::invalid_argument("user id must be numeric");
                                        }),
                    std::invalid_argument);

  REQUIRE(f.exporter->size() == 2);
  auto server = f.exporter->find("GET /users/{id}");
  REQUIRE(server->status.code() == tinytrace::status_code::error);
  REQUIRE(server->status.message() == "user id must be numeric");
  REQUIRE(server->attributes.count("http.response.status_code") == 0);
  REQUIRE(tinytrace::execution_context::current_span() == nullptr);
}

TEST_CASE("unit: abandoned request is closed as cancelled", "[unit]")
{
  fixture f{};
  {
    auto scope = f.middleware.begin(get_user_request());
    REQUIRE_FALSE(scope.is_closed());
  }
  REQUIRE(f.exporter->size() == 1);
  auto server = f.exporter->spans().front();
  REQUIRE(server.status.code() == tinytrace::status_code::error);
  REQUIRE(server.status.message() == "cancelled");
}

TEST_CASE("unit: request scope can be moved", "[unit]")
{
  fixture f{};
  std::optional<tinytrace::server_request_scope> holder{};
  {
    auto scope = f.middleware.begin(get_user_request());
    holder.emplace(std::move(scope));
  }
  REQUIRE(f.exporter->size() == 0);
  REQUIRE_FALSE(holder->is_closed());
  holder->fail("upstream unavailable");
  REQUIRE(holder->is_closed());
  REQUIRE(f.exporter->spans().front().status.message() == "upstream unavailable");
  holder.reset();
  REQUIRE(f.exporter->size() == 1);
}

TEST_CASE("unit: trace id response header can be renamed or disabled", "[unit]")
{
  SECTION("renamed")
  {
    fixture f{ tinytrace::tracing_options{}.trace_id_header_name("x-request-trace") };
    auto response = f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
      return tinytrace::outbound_response{};
    });
    REQUIRE(response.headers.count("x-trace-id") == 0);
    REQUIRE(response.headers["x-request-trace"] ==
            f.exporter->spans().front().context.trace_id().to_hex());
  }

  SECTION("disabled")
  {
    fixture f{ tinytrace::tracing_options{}.include_trace_id_header(false) };
    auto response = f.middleware.handle(get_user_request(), [](const tinytrace::inbound_request&) {
      return tinytrace::outbound_response{};
    });
    REQUIRE(response.headers.empty());
  }
}

TEST_CASE("unit: outbound call carries client span to downstream service", "[unit]")
{
  fixture f{};
  auto scope = f.middleware.begin(get_user_request());

  tinytrace::header_map outgoing{ { "accept", "application/json" } };
  auto client = scope.run([&]() {
    return f.middleware.start_outbound_span("GET inventory", outgoing);
  });
  REQUIRE(client->kind() == tinytrace::span_kind::client);
  REQUIRE(client->context().parent_span_id() == scope.span()->context().span_id());

  auto downstream = tinytrace::propagation::extract(outgoing);
  REQUIRE(downstream.has_value());
  REQUIRE(downstream->trace_id() == scope.span()->context().trace_id());
  REQUIRE(downstream->span_id() == client->context().span_id());
  REQUIRE(downstream->sampled());

  client->set_attribute("http.response.status_code", 200);
  client->end();
  scope.complete(200);

  REQUIRE(f.exporter->size() == 2);
}

TEST_CASE("unit: asynchronous continuation keeps the request span", "[unit]")
{
  fixture f{};
  asio::io_context io{};

  auto scope = std::make_shared<tinytrace::server_request_scope>(f.middleware.begin(get_user_request()));
  std::shared_ptr<tinytrace::span> seen{};
  std::optional<tinytrace::span_context> child_context{};

  asio::post(io, scope->wrap([&]() {
    seen = tinytrace::execution_context::current_span();
    auto child = f.tracer->start_span("async step");
    child_context = child->context();
    child->end();
    scope->complete(200);
  }));

  std::thread worker([&io]() {
    io.run();
  });
  worker.join();

  REQUIRE(seen == scope->span());
  REQUIRE(child_context->parent_span_id() == scope->span()->context().span_id());
  REQUIRE(scope->is_closed());
  REQUIRE(f.exporter->size() == 2);
}

#if !TINYTRACE_DEBUG_BUILD
// misuse is fatal in debug builds
TEST_CASE("unit: second completion is ignored", "[unit]")
{
  fixture f{};
  auto scope = f.middleware.begin(get_user_request());
  scope.complete(200);
  scope.complete(500);
  scope.fail("late failure");

  REQUIRE(f.exporter->size() == 1);
  REQUIRE(f.exporter->spans().front().status.code() == tinytrace::status_code::ok);
}
#endif
