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

#include "batching_span_exporter.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/concurrent_bounded_queue.hxx"

#include <tinytrace/error_codes.hxx>

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace tinytrace::core::tracing
{
namespace
{
auto
normalize(batching_exporter_options options) -> batching_exporter_options
{
  options.batch_max_size = std::max<std::size_t>(options.batch_max_size, 1);
  options.max_export_attempts = std::max<std::size_t>(options.max_export_attempts, 1);
  // a full batch must fit into the queue, otherwise the size trigger never fires
  if (options.max_queue_size < options.batch_max_size) {
    TT_LOG_WARNING("span export queue capacity {} is smaller than the batch size {}, using {}",
                   options.max_queue_size,
                   options.batch_max_size,
                   options.batch_max_size);
    options.max_queue_size = options.batch_max_size;
  }
  return options;
}
} // namespace

class batching_span_exporter_impl
  : public std::enable_shared_from_this<batching_span_exporter_impl>
{
  using span_queue = utils::concurrent_bounded_queue<span_data>;

public:
  batching_span_exporter_impl(asio::io_context& ctx,
                              std::shared_ptr<span_transport> transport,
                              batching_exporter_options options)
    : ctx_{ ctx }
    , transport_{ std::move(transport) }
    , options_{ normalize(std::move(options)) }
    , queue_{ options_.max_queue_size }
    , flush_timer_{ ctx }
  {
  }

  void start()
  {
    if (stopped_) {
      return;
    }
    TT_LOG_DEBUG("starting span exporter: transport={}, batch_max_size={}, max_queue_size={}, "
                 "flush_interval={}ms, max_export_attempts={}",
                 transport_->description(),
                 options_.batch_max_size,
                 options_.max_queue_size,
                 options_.flush_interval.count(),
                 options_.max_export_attempts);
    if (options_.flush_interval > std::chrono::milliseconds::zero()) {
      rearm();
    }
  }

  void stop()
  {
    flush_timer_.cancel();
  }

  auto enqueue(span_data&& span) -> std::error_code
  {
    if (stopped_) {
      ++dropped_after_shutdown_;
      return errc::tracing::exporter_stopped;
    }

    auto [status, size] = queue_.try_push(std::move(span));
    if (status == span_queue::push_status::closed) {
      // shutdown() closed the queue after the check above
      ++dropped_after_shutdown_;
      return errc::tracing::exporter_stopped;
    }
    if (status == span_queue::push_status::full) {
      return errc::tracing::queue_overflow;
    }
    ++recorded_;

    if (size >= options_.batch_max_size && !flush_scheduled_.exchange(true)) {
      asio::post(ctx_, [self = shared_from_this()]() {
        self->flush_scheduled_ = false;
        self->flush();
      });
    }
    return {};
  }

  void record(span_data&& span)
  {
    auto trace = span.context.trace_id();
    if (auto ec = enqueue(std::move(span)); ec) {
      if (ec == errc::tracing::queue_overflow) {
        auto dropped = queue_.dropped_count();
        // the first drop, and then every 1000th, to keep the log readable under sustained load
        if (dropped % 1000 == 1) {
          TT_LOG_WARNING("span export queue is full (capacity={}), {} span(s) dropped so far",
                         queue_.capacity(),
                         dropped);
        }
      }
      TT_LOG_DEBUG("span of trace {} not exported: {}", trace.to_hex(), ec.message());
    }
  }

  void flush()
  {
    const std::scoped_lock lock(flush_mutex_);

    // spans recorded while flushing wait for the next trigger
    auto pending = queue_.size();
    while (pending > 0) {
      auto batch = queue_.pop_batch(std::min(pending, options_.batch_max_size));
      if (batch.empty()) {
        break;
      }
      pending -= batch.size();
      export_batch(batch);
    }
  }

  void shutdown()
  {
    if (stopped_.exchange(true)) {
      return;
    }
    queue_.close();
    stop();
    flush();
    auto current = stats();
    TT_LOG_DEBUG("span exporter stopped: recorded={}, exported={}, dropped_on_overflow={}, "
                 "dropped_on_failure={}, failed_batches={}",
                 current.recorded,
                 current.exported,
                 current.dropped_on_overflow,
                 current.dropped_on_failure,
                 current.failed_batches);
  }

  [[nodiscard]] auto stats() const -> exporter_stats
  {
    exporter_stats result{};
    result.recorded = recorded_;
    result.exported = exported_;
    result.dropped_on_overflow = queue_.dropped_count();
    result.dropped_on_failure = dropped_on_failure_;
    result.dropped_after_shutdown = dropped_after_shutdown_;
    result.failed_batches = failed_batches_;
    result.export_attempts = export_attempts_;
    return result;
  }

private:
  void rearm()
  {
    flush_timer_.expires_after(options_.flush_interval);
    flush_timer_.async_wait([self = shared_from_this()](std::error_code ec) -> void {
      if (ec == asio::error::operation_aborted || self->stopped_) {
        return;
      }

      self->flush();
      self->rearm();
    });
  }

  auto send(const std::vector<span_data>& batch) -> std::error_code
  {
    ++export_attempts_;
    try {
      return transport_->send(batch);
    } catch (const std::exception& e) {
      TT_LOG_DEBUG(
        "transport {} failed to encode the batch: {}", transport_->description(), e.what());
      return errc::tracing::encoding_failure;
    }
  }

  void export_batch(const std::vector<span_data>& batch)
  {
    std::error_code ec{};
    std::size_t attempt = 1;
    for (;; ++attempt) {
      ec = send(batch);
      if (!ec) {
        exported_ += batch.size();
        TT_LOG_TRACE("exported {} span(s) via {} (attempt {})",
                     batch.size(),
                     transport_->description(),
                     attempt);
        return;
      }
      // the same batch will not encode any better next time
      if (attempt >= options_.max_export_attempts || ec == errc::tracing::encoding_failure) {
        break;
      }
      auto delay = options_.backoff(attempt);
      TT_LOG_DEBUG("export attempt {}/{} of {} span(s) failed: {}, retrying in {}ms",
                   attempt,
                   options_.max_export_attempts,
                   batch.size(),
                   ec.message(),
                   delay.count());
      std::this_thread::sleep_for(delay);
    }

    dropped_on_failure_ += batch.size();
    ++failed_batches_;
    TT_LOG_WARNING("dropping batch of {} span(s) after {} failed export attempt(s) via {}, last "
                   "error: {}",
                   batch.size(),
                   attempt,
                   transport_->description(),
                   ec.message());
  }

  asio::io_context& ctx_;
  std::shared_ptr<span_transport> transport_;
  batching_exporter_options options_;
  span_queue queue_;
  asio::steady_timer flush_timer_;
  std::mutex flush_mutex_{};
  std::atomic_bool flush_scheduled_{ false };
  std::atomic_bool stopped_{ false };

  std::atomic_uint64_t recorded_{ 0 };
  std::atomic_uint64_t exported_{ 0 };
  std::atomic_uint64_t dropped_on_failure_{ 0 };
  std::atomic_uint64_t dropped_after_shutdown_{ 0 };
  std::atomic_uint64_t failed_batches_{ 0 };
  std::atomic_uint64_t export_attempts_{ 0 };
};

batching_span_exporter::batching_span_exporter(asio::io_context& ctx,
                                               std::shared_ptr<span_transport> transport,
                                               batching_exporter_options options)
  : impl_{ std::make_shared<batching_span_exporter_impl>(ctx,
                                                         std::move(transport),
                                                         std::move(options)) }
{
}

batching_span_exporter::~batching_span_exporter()
{
  impl_->stop();
}

void
batching_span_exporter::start()
{
  impl_->start();
}

void
batching_span_exporter::record(span_data&& span)
{
  impl_->record(std::move(span));
}

auto
batching_span_exporter::enqueue(span_data&& span) -> std::error_code
{
  return impl_->enqueue(std::move(span));
}

void
batching_span_exporter::flush()
{
  impl_->flush();
}

void
batching_span_exporter::shutdown()
{
  impl_->shutdown();
}

auto
batching_span_exporter::stats() const -> exporter_stats
{
  return impl_->stats();
}
} // namespace tinytrace::core::tracing
