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

#include "otlp_http_transport.hxx"

#include "core/io/http_parser.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"
#include "otlp_json.hxx"

#include <tinytrace/build_config.hxx>
#include <tinytrace/error_codes.hxx>

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <fmt/core.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace tinytrace::core::tracing
{
namespace
{
constexpr std::string_view http_scheme{ "http://" };

auto
is_valid_port(std::string_view port) -> bool
{
  if (port.empty() || port.size() > 5) {
    return false;
  }
  unsigned long value = 0;
  for (const char c : port) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  return value > 0 && value <= 65535;
}

/**
 * One request/response exchange with the collector, driven by a private io_context.
 */
class http_exchange : public std::enable_shared_from_this<http_exchange>
{
public:
  http_exchange(asio::io_context& ctx, http_endpoint endpoint, std::string request)
    : endpoint_{ std::move(endpoint) }
    , request_{ std::move(request) }
    , resolver_{ ctx }
    , socket_{ ctx }
  {
  }

  void start()
  {
    resolver_.async_resolve(
      endpoint_.host,
      endpoint_.port,
      [self = shared_from_this()](std::error_code ec,
                                  const asio::ip::tcp::resolver::results_type& endpoints) {
        if (self->done_) {
          return;
        }
        if (ec) {
          TT_LOG_DEBUG("unable to resolve collector address \"{}\": {}",
                       self->endpoint_.host,
                       ec.message());
          return self->finish(errc::tracing::connection_refused);
        }
        asio::async_connect(
          self->socket_,
          endpoints,
          [self](std::error_code connect_ec, const asio::ip::tcp::endpoint& /* endpoint */) {
            if (self->done_) {
              return;
            }
            if (connect_ec) {
              TT_LOG_DEBUG("unable to connect to collector {}: {}",
                           self->endpoint_.host_header(),
                           connect_ec.message());
              return self->finish(errc::tracing::connection_refused);
            }
            self->write();
          });
      });
  }

  void timeout()
  {
    finish(errc::tracing::export_timeout);
  }

  [[nodiscard]] auto is_done() const -> bool
  {
    return done_;
  }

  [[nodiscard]] auto error() const -> std::error_code
  {
    return ec_;
  }

  [[nodiscard]] auto response() const -> const io::http_response&
  {
    return parser_.response;
  }

private:
  void write()
  {
    asio::async_write(
      socket_,
      asio::buffer(request_),
      [self = shared_from_this()](std::error_code ec, std::size_t /* bytes_transferred */) {
        if (self->done_) {
          return;
        }
        if (ec) {
          TT_LOG_DEBUG("unable to send export request to {}: {}",
                       self->endpoint_.host_header(),
                       ec.message());
          return self->finish(errc::tracing::transport_failure);
        }
        self->read();
      });
  }

  void read()
  {
    socket_.async_read_some(
      asio::buffer(input_buffer_),
      [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
        if (self->done_) {
          return;
        }
        if (ec == asio::error::eof) {
          auto res = self->parser_.finish();
          if (res.failure || !res.complete) {
            TT_LOG_DEBUG("collector {} closed the connection before a complete response",
                         self->endpoint_.host_header());
            return self->finish(errc::tracing::transport_failure);
          }
          return self->finish({});
        }
        if (ec) {
          TT_LOG_DEBUG("unable to read export response from {}: {}",
                       self->endpoint_.host_header(),
                       ec.message());
          return self->finish(errc::tracing::transport_failure);
        }
        auto res = self->parser_.feed(self->input_buffer_.data(), bytes_transferred);
        if (res.failure) {
          TT_LOG_DEBUG("unable to parse export response from {}: {}",
                       self->endpoint_.host_header(),
                       res.error);
          return self->finish(errc::tracing::transport_failure);
        }
        if (res.complete) {
          return self->finish({});
        }
        self->read();
      });
  }

  void finish(std::error_code ec)
  {
    if (done_) {
      return;
    }
    done_ = true;
    ec_ = ec;
    resolver_.cancel();
    std::error_code ignored{};
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  http_endpoint endpoint_;
  std::string request_;
  asio::ip::tcp::resolver resolver_;
  asio::ip::tcp::socket socket_;
  std::array<char, 16384> input_buffer_{};
  io::http_parser parser_{};
  bool done_{ false };
  std::error_code ec_{};
};
} // namespace

auto
http_endpoint::host_header() const -> std::string
{
  auto host_name = host.find(':') == std::string::npos ? host : fmt::format("[{}]", host);
  if (port == "80") {
    return host_name;
  }
  return fmt::format("{}:{}", host_name, port);
}

auto
parse_http_endpoint(std::string_view url) -> std::optional<http_endpoint>
{
  if (url.substr(0, http_scheme.size()) != http_scheme) {
    return {};
  }
  auto rest = url.substr(http_scheme.size());

  http_endpoint endpoint{};
  std::string_view authority = rest.substr(0, rest.find('/'));
  if (authority.size() < rest.size()) {
    auto path = rest.substr(authority.size());
    if (path.find_first_of("?#") != std::string_view::npos) {
      return {};
    }
    endpoint.path = std::string{ path };
  }

  std::string_view port{};
  if (!authority.empty() && authority.front() == '[') {
    auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      return {};
    }
    endpoint.host = std::string{ authority.substr(1, closing - 1) };
    auto tail = authority.substr(closing + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return {};
      }
      port = tail.substr(1);
      if (!is_valid_port(port)) {
        return {};
      }
    }
  } else {
    auto colon = authority.find(':');
    endpoint.host = std::string{ authority.substr(0, colon) };
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
      if (!is_valid_port(port)) {
        return {};
      }
    }
  }
  if (endpoint.host.empty()) {
    return {};
  }
  if (!port.empty()) {
    endpoint.port = std::string{ port };
  }
  return endpoint;
}

otlp_http_transport::otlp_http_transport(std::string endpoint,
                                         attribute_map resource,
                                         std::chrono::milliseconds timeout)
  : url_{ std::move(endpoint) }
  , endpoint_{ parse_http_endpoint(url_) }
  , resource_{ std::move(resource) }
  , timeout_{ timeout }
{
  if (!endpoint_) {
    TT_LOG_WARNING("unable to parse export endpoint \"{}\", expected http://host[:port][/path]. "
                   "Spans will not be delivered",
                   url_);
  }
}

auto
otlp_http_transport::description() const -> std::string
{
  return fmt::format("otlp_http({})", url_);
}

auto
otlp_http_transport::send(const std::vector<span_data>& batch) -> std::error_code
{
  if (!endpoint_) {
    return errc::tracing::invalid_endpoint;
  }

  auto body = utils::json::generate(otlp::to_export_request(resource_, batch));
  auto request = fmt::format("POST {} HTTP/1.1\r\n"
                             "Host: {}\r\n"
                             "Content-Type: application/json\r\n"
                             "Content-Length: {}\r\n"
                             "User-Agent: {}/{}\r\n"
                             "Connection: close\r\n"
                             "\r\n"
                             "{}",
                             endpoint_->path,
                             endpoint_->host_header(),
                             body.size(),
                             TINYTRACE_SDK_NAME,
                             TINYTRACE_VERSION_STRING,
                             body);

  asio::io_context ctx{};
  auto exchange = std::make_shared<http_exchange>(ctx, endpoint_.value(), std::move(request));
  exchange->start();
  ctx.run_for(timeout_);
  if (!exchange->is_done()) {
    exchange->timeout();
    // let the aborted operations complete before the socket goes away
    ctx.restart();
    ctx.run();
  }

  if (auto ec = exchange->error(); ec) {
    return ec;
  }

  const auto& response = exchange->response();
  if (!response.is_success()) {
    TT_LOG_DEBUG("collector {} rejected batch of {} span(s): {} {}, body: {}",
                 endpoint_->host_header(),
                 batch.size(),
                 response.status_code,
                 response.status_message,
                 response.body);
    return errc::tracing::unexpected_status;
  }

  if (!response.body.empty()) {
    try {
      auto payload = utils::json::parse(response.body);
      if (const auto* partial = payload.is_object() ? payload.find("partialSuccess") : nullptr;
          partial != nullptr && partial->is_object() && !partial->get_object().empty()) {
        TT_LOG_WARNING("collector {} partially accepted batch of {} span(s): {}",
                       endpoint_->host_header(),
                       batch.size(),
                       utils::json::generate(*partial));
      }
    } catch (const std::exception& e) {
      TT_LOG_DEBUG(
        "ignoring non-JSON export response from {}: {}", endpoint_->host_header(), e.what());
    }
  }
  return {};
}
} // namespace tinytrace::core::tracing
