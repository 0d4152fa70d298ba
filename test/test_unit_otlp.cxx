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

#include "core/tracing/otlp_http_transport.hxx"
#include "core/tracing/otlp_json.hxx"
#include "core/utils/json.hxx"

#include <tinytrace/error_codes.hxx>
#include <tinytrace/sampler.hxx>

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <tao/json/value.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <future>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace std::literals::chrono_literals;

namespace
{
auto
make_record(std::string name, bool with_parent) -> tinytrace::span_data
{
  tinytrace::trace_id trace{ 0x4bf92f3577b34da6ULL, 0xa3ce929d0e0e4736ULL };
  std::optional<tinytrace::span_id> parent{};
  if (with_parent) {
    parent = tinytrace::span_id{ 0x00f067aa0ba902b7ULL };
  }
  tinytrace::span_context context{
    trace, tinytrace::span_id{ 0x1122334455667788ULL }, parent, true
  };
  std::chrono::system_clock::time_point start{
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::nanoseconds{ 1700000000123456789LL })
  };
  return { context, std::move(name), tinytrace::span_kind::server, start, start + 5ms };
}

/**
 * Accepts one connection on the loopback interface, captures the request, and answers with the
 * given response (or keeps the connection silent until destroyed).
 */
class one_shot_collector
{
public:
  explicit one_shot_collector(std::optional<std::string> response)
    : response_{ std::move(response) }
    , acceptor_{ io_, asio::ip::tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } }
  {
    thread_ = std::thread([this]() {
      serve();
    });
  }

  one_shot_collector(const one_shot_collector& other) = delete;
  one_shot_collector(one_shot_collector&& other) = delete;
  auto operator=(const one_shot_collector& other) -> one_shot_collector& = delete;
  auto operator=(one_shot_collector&& other) -> one_shot_collector& = delete;

  ~one_shot_collector()
  {
    release_.set_value();
    thread_.join();
  }

  [[nodiscard]] auto url() const -> std::string
  {
    return fmt::format("http://127.0.0.1:{}/v1/traces", acceptor_.local_endpoint().port());
  }

  auto request() -> std::string
  {
    return request_.get_future().get();
  }

private:
  void serve()
  {
    asio::ip::tcp::socket socket{ io_ };
    std::error_code ec{};
    acceptor_.accept(socket, ec);
    if (ec) {
      request_.set_value({});
      return;
    }

    std::string data{};
    asio::read_until(socket, asio::dynamic_buffer(data), "\r\n\r\n", ec);
    auto header_end = data.find("\r\n\r\n") + 4;
    std::size_t content_length{ 0 };
    static const std::string length_header{ "Content-Length: " };
    if (auto pos = data.find(length_header); pos != std::string::npos && pos < header_end) {
      content_length = std::stoul(data.substr(pos + length_header.size()));
    }
    if (auto received = data.size() - header_end; !ec && received < content_length) {
      asio::read(socket,
                 asio::dynamic_buffer(data),
                 asio::transfer_exactly(content_length - received),
                 ec);
    }
    request_.set_value(data);

    if (response_) {
      asio::write(socket, asio::buffer(response_.value()), ec);
    } else {
      release_.get_future().wait();
    }
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

  std::optional<std::string> response_;
  asio::io_context io_{};
  asio::ip::tcp::acceptor acceptor_;
  std::promise<std::string> request_{};
  std::promise<void> release_{};
  std::thread thread_{};
};

auto
body_of(const std::string& request) -> std::string
{
  return request.substr(request.find("\r\n\r\n") + 4);
}
} // namespace

TEST_CASE("unit: attribute values are encoded with their OTLP type", "[unit]")
{
  using tinytrace::core::tracing::otlp::to_json;

  REQUIRE(to_json(tinytrace::attribute_value{ true }).at("boolValue").get_boolean() == true);
  REQUIRE(to_json(tinytrace::attribute_value{ std::int64_t{ 9007199254740993 } })
            .at("intValue")
            .get_string() == "9007199254740993");
  REQUIRE(to_json(tinytrace::attribute_value{ 0.5 }).at("doubleValue").get_double() == 0.5);
  REQUIRE(to_json(tinytrace::attribute_value{ std::string{ "GET" } })
            .at("stringValue")
            .get_string() == "GET");

  tinytrace::attribute_map attributes{
    { "http.request.method", std::string{ "GET" } },
    { "http.response.status_code", std::int64_t{ 200 } },
  };
  auto encoded = to_json(attributes);
  REQUIRE(encoded.get_array().size() == 2);
  REQUIRE(encoded.get_array().at(0).at("key").get_string() == "http.request.method");
  REQUIRE(encoded.get_array().at(1).at("value").at("intValue").get_string() == "200");
}

TEST_CASE("unit: non-finite double attributes do not break the batch", "[unit]")
{
  using tinytrace::core::tracing::otlp::to_json;

  REQUIRE(to_json(tinytrace::attribute_value{ std::nan("") }).at("doubleValue").get_string() ==
          "NaN");
  REQUIRE(to_json(tinytrace::attribute_value{ std::numeric_limits<double>::infinity() })
            .at("doubleValue")
            .get_string() == "Infinity");
  REQUIRE(to_json(tinytrace::attribute_value{ -std::numeric_limits<double>::infinity() })
            .at("doubleValue")
            .get_string() == "-Infinity");

  auto broken = make_record("ratio of nothing", false);
  broken.attributes["ratio"] = std::nan("");
  std::vector<tinytrace::span_data> spans{ make_record("neighbour", true), broken };

  std::string body{};
  REQUIRE_NOTHROW(body = tinytrace::core::utils::json::generate(
                    tinytrace::core::tracing::otlp::to_export_request({}, spans)));
  auto reparsed = tinytrace::core::utils::json::parse(body);
  const auto& encoded_spans =
    reparsed.at("resourceSpans").get_array().at(0).at("scopeSpans").get_array().at(0).at("spans");
  REQUIRE(encoded_spans.get_array().size() == 2);
  const auto& ratio = encoded_spans.get_array().at(1).at("attributes").get_array().at(0);
  REQUIRE(ratio.at("key").get_string() == "ratio");
  REQUIRE(ratio.at("value").at("doubleValue").get_string() == "NaN");
}

TEST_CASE("unit: span record is encoded as OTLP span", "[unit]")
{
  auto record = make_record("GET /users/{id}", true);
  record.attributes["http.route"] = std::string{ "/users/{id}" };
  record.events.push_back({ "retry", record.start_time + 1ms, { { "attempt", std::int64_t{ 2 } } } });
  record.status = tinytrace::span_status::error("HTTP 503");

  auto encoded = tinytrace::core::tracing::otlp::to_json(record);
  REQUIRE(encoded.at("traceId").get_string() == "4bf92f3577b34da6a3ce929d0e0e4736");
  REQUIRE(encoded.at("spanId").get_string() == "1122334455667788");
  REQUIRE(encoded.at("parentSpanId").get_string() == "00f067aa0ba902b7");
  REQUIRE(encoded.at("name").get_string() == "GET /users/{id}");
  REQUIRE(encoded.at("kind").get_signed() == tinytrace::core::tracing::otlp::span_kind_server);
  REQUIRE(encoded.at("startTimeUnixNano").get_string() == "1700000000123456789");
  REQUIRE(encoded.at("endTimeUnixNano").get_string() == "1700000000128456789");
  REQUIRE(encoded.at("attributes").get_array().size() == 1);
  REQUIRE(encoded.at("status").at("code").get_signed() ==
          tinytrace::core::tracing::otlp::status_code_error);
  REQUIRE(encoded.at("status").at("message").get_string() == "HTTP 503");

  const auto& events = encoded.at("events").get_array();
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].at("name").get_string() == "retry");
  REQUIRE(events[0].at("timeUnixNano").get_string() == "1700000000124456789");

  SECTION("root span has neither parent nor events")
  {
    auto root = tinytrace::core::tracing::otlp::to_json(make_record("root", false));
    REQUIRE(root.find("parentSpanId") == nullptr);
    REQUIRE(root.find("events") == nullptr);
    REQUIRE(root.at("status").at("code").get_signed() ==
            tinytrace::core::tracing::otlp::status_code_unset);
    REQUIRE(root.at("status").find("message") == nullptr);
  }
}

TEST_CASE("unit: export request groups spans under resource and scope", "[unit]")
{
  tinytrace::attribute_map resource{
    { "service.name", std::string{ "checkout" } },
  };
  std::vector<tinytrace::span_data> spans{ make_record("first", false), make_record("second", true) };

  auto request = tinytrace::core::tracing::otlp::to_export_request(resource, spans);
  const auto& resource_spans = request.at("resourceSpans").get_array();
  REQUIRE(resource_spans.size() == 1);
  const auto& attributes = resource_spans[0].at("resource").at("attributes").get_array();
  REQUIRE(attributes.size() == 1);
  REQUIRE(attributes[0].at("value").at("stringValue").get_string() == "checkout");

  const auto& scope_spans = resource_spans[0].at("scopeSpans").get_array();
  REQUIRE(scope_spans.size() == 1);
  REQUIRE(scope_spans[0].at("scope").at("name").get_string() == "tinytrace");
  const auto& encoded_spans = scope_spans[0].at("spans").get_array();
  REQUIRE(encoded_spans.size() == 2);
  REQUIRE(encoded_spans[0].at("name").get_string() == "first");
  REQUIRE(encoded_spans[1].at("name").get_string() == "second");

  // survives a trip through the wire encoding
  auto reparsed =
    tinytrace::core::utils::json::parse(tinytrace::core::utils::json::generate(request));
  REQUIRE(reparsed == request);
}

TEST_CASE("unit: collector endpoint parsing", "[unit]")
{
  using tinytrace::core::tracing::parse_http_endpoint;

  auto full = parse_http_endpoint("http://otel-collector:4318/v1/traces");
  REQUIRE(full.has_value());
  REQUIRE(full->host == "otel-collector");
  REQUIRE(full->port == "4318");
  REQUIRE(full->path == "/v1/traces");
  REQUIRE(full->host_header() == "otel-collector:4318");

  auto defaults = parse_http_endpoint("http://collector");
  REQUIRE(defaults.has_value());
  REQUIRE(defaults->port == "80");
  REQUIRE(defaults->path == "/v1/traces");
  REQUIRE(defaults->host_header() == "collector");

  auto custom_path = parse_http_endpoint("http://collector/ingest/traces");
  REQUIRE(custom_path.has_value());
  REQUIRE(custom_path->path == "/ingest/traces");

  auto ipv6 = parse_http_endpoint("http://[::1]:4318");
  REQUIRE(ipv6.has_value());
  REQUIRE(ipv6->host == "::1");
  REQUIRE(ipv6->host_header() == "[::1]:4318");

  for (const auto* invalid : { "https://collector:4318",
                               "collector:4318",
                               "http://",
                               "http://:4318",
                               "http://collector:",
                               "http://collector:0",
                               "http://collector:65536",
                               "http://collector:http",
                               "http://collector/v1/traces?debug=1",
                               "http://collector/v1/traces#spans",
                               "http://[::1",
                               "http://[::1]4318" }) {
    INFO(invalid);
    REQUIRE_FALSE(parse_http_endpoint(invalid).has_value());
  }
}

TEST_CASE("unit: otlp transport posts batch to collector", "[unit]")
{
  test::utils::init_logger();
  one_shot_collector collector{
    "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}"
  };
  tinytrace::attribute_map resource{ { "service.name", std::string{ "checkout" } } };
  tinytrace::core::tracing::otlp_http_transport transport(collector.url(), resource, 5s);
  REQUIRE(transport.description() == fmt::format("otlp_http({})", collector.url()));

  auto ec = transport.send({ make_record("first", false), make_record("second", true) });
  REQUIRE_SUCCESS(ec);

  auto request = collector.request();
  REQUIRE(request.rfind("POST /v1/traces HTTP/1.1\r\n", 0) == 0);
  REQUIRE(request.find("Content-Type: application/json\r\n") != std::string::npos);
  REQUIRE(request.find("Connection: close\r\n") != std::string::npos);

  auto payload = tinytrace::core::utils::json::parse(body_of(request));
  const auto& spans =
    payload.at("resourceSpans").get_array().at(0).at("scopeSpans").get_array().at(0).at("spans").get_array();
  REQUIRE(spans.size() == 2);
  REQUIRE(spans[1].at("parentSpanId").get_string() == "00f067aa0ba902b7");
}

TEST_CASE("unit: otlp transport accepts partial success and close-delimited responses", "[unit]")
{
  test::utils::init_logger();

  SECTION("partial success")
  {
    one_shot_collector collector{ "HTTP/1.1 200 OK\r\nContent-Length: 71\r\n\r\n"
                                  R"({"partialSuccess":{"rejectedSpans":"1","errorMessage":"bad attribute"}})" };
    tinytrace::core::tracing::otlp_http_transport transport(collector.url(), {}, 5s);
    auto ec = transport.send({ make_record("span", false) });
    REQUIRE_SUCCESS(ec);
  }

  SECTION("no content length")
  {
    one_shot_collector collector{ "HTTP/1.1 200 OK\r\nConnection: close\r\n\r\naccepted" };
    tinytrace::core::tracing::otlp_http_transport transport(collector.url(), {}, 5s);
    auto ec = transport.send({ make_record("span", false) });
    REQUIRE_SUCCESS(ec);
  }
}

TEST_CASE("unit: otlp transport reports collector failures", "[unit]")
{
  test::utils::init_logger();

  SECTION("non-2xx status")
  {
    one_shot_collector collector{ "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\n\r\nbusy" };
    tinytrace::core::tracing::otlp_http_transport transport(collector.url(), {}, 5s);
    REQUIRE(transport.send({ make_record("span", false) }) ==
            tinytrace::errc::tracing::unexpected_status);
  }

  SECTION("silent collector")
  {
    one_shot_collector collector{ std::nullopt };
    tinytrace::core::tracing::otlp_http_transport transport(collector.url(), {}, 200ms);
    auto started = std::chrono::steady_clock::now();
    REQUIRE(transport.send({ make_record("span", false) }) ==
            tinytrace::errc::tracing::export_timeout);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
  }

  SECTION("connection refused")
  {
    std::string url{};
    {
      asio::io_context io{};
      asio::ip::tcp::acceptor reserved{
        io, asio::ip::tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 }
      };
      url = fmt::format("http://127.0.0.1:{}/v1/traces", reserved.local_endpoint().port());
    }
    tinytrace::core::tracing::otlp_http_transport transport(url, {}, 5s);
    REQUIRE(transport.send({ make_record("span", false) }) ==
            tinytrace::errc::tracing::connection_refused);
  }

  SECTION("invalid endpoint")
  {
    tinytrace::core::tracing::otlp_http_transport transport("https://collector:4318", {}, 5s);
    REQUIRE(transport.send({ make_record("span", false) }) ==
            tinytrace::errc::tracing::invalid_endpoint);
  }
}
