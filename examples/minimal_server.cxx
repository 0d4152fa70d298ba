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

#include <tinytrace/logger.hxx>
#include <tinytrace/tracer.hxx>
#include <tinytrace/tracing_middleware.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <fmt/core.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/*
 * Simulates a small HTTP service: every request runs on a worker pool, continues the caller's
 * trace when a traceparent header is present, queries a "database" and calls a downstream service.
 *
 * Usage: minimal_server [collector-url]
 *   without the URL, finished spans are written to the console log as OTLP/JSON
 */

namespace
{
auto
load_inventory(tinytrace::tracing_middleware& middleware, const std::string& sku) -> int
{
  auto tracer = middleware.get_tracer();
  auto stock = tracer->instrumented("SELECT stock", [&sku]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
    if (sku == "unknown") {
      throw std::out_of_range("no such sku: " + sku);
    }
    return 7;
  });

  tinytrace::header_map outgoing{ { "accept", "application/json" } };
  auto call = middleware.start_outbound_span("GET pricing", outgoing);
  call->set_attribute("server.address", "pricing.internal");
  fmt::print("  -> outbound traceparent: {}\n",
             outgoing[tinytrace::propagation::traceparent_header]);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  call->set_attribute("http.response.status_code", 200);
  call->end();
  return stock;
}
} // namespace

int
main(int argc, const char* argv[])
{
  tinytrace::logger::initialize_console_logger();
  tinytrace::logger::set_level(tinytrace::logger::log_level::info);

  tinytrace::tracing_options options{};
  options.service_name("inventory")
    .service_version("1.0.0")
    .environment("example")
    .flush_interval(std::chrono::seconds{ 1 })
    .span_event_detail(tinytrace::span_event_detail::none);
  if (argc > 1) {
    options.export_endpoint(argv[1]);
  }

  // exporter runs on its own io_context, away from the request threads
  asio::io_context exporter_ctx{};
  auto guard = asio::make_work_guard(exporter_ctx);
  std::thread exporter_thread([&exporter_ctx]() {
    exporter_ctx.run();
  });

  auto tracer = tinytrace::tracer::create(exporter_ctx, options);
  tracer->start();
  tinytrace::tracing_middleware middleware{ tracer };

  std::vector<tinytrace::inbound_request> requests{
    { "GET", "/inventory/{sku}", "/inventory/apple", {} },
    { "GET",
      "/inventory/{sku}",
      "/inventory/pear",
      { { "traceparent", "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01" } } },
    { "GET", "/inventory/{sku}", "/inventory/unknown", {} },
  };

  asio::thread_pool workers{ 2 };
  std::vector<std::future<void>> done{};
  for (const auto& request : requests) {
    auto finished = std::make_shared<std::promise<void>>();
    done.emplace_back(finished->get_future());
    asio::post(workers, [&middleware, request, finished]() {
      auto sku = request.target.substr(request.target.rfind('/') + 1);
      try {
        auto response =
          middleware.handle(request, [&middleware, &sku](const tinytrace::inbound_request&) {
            auto stock = load_inventory(middleware, sku);
            return tinytrace::outbound_response{
              200, {}, fmt::format(R"({{"sku":"{}","stock":{}}})", sku, stock)
            };
          });
        fmt::print("{} -> {} {} (x-trace-id: {})\n",
                   request.target,
                   response.status_code,
                   response.body,
                   response.headers["x-trace-id"]);
      } catch (const std::exception& e) {
        fmt::print("{} -> 500 ({})\n", request.target, e.what());
      }
      finished->set_value();
    });
  }
  for (auto& f : done) {
    f.wait();
  }
  workers.join();

  asio::post(exporter_ctx, [tracer]() {
    tracer->stop();
  });
  guard.reset();
  exporter_thread.join();

  tinytrace::logger::shutdown_all_loggers();
  return 0;
}
