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

#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace tinytrace::core::utils
{
/**
 * FIFO queue with a fixed capacity. When full, the incoming item is rejected (drop-newest) and
 * counted, so producers never block. A closed queue rejects every push, but keeps the items it
 * already holds for the consumer.
 */
template<typename T>
class concurrent_bounded_queue
{
private:
  mutable std::mutex mutex_;
  std::deque<T> data_;
  std::size_t dropped_count_{ 0 };
  std::size_t capacity_{};
  bool closed_{ false };

public:
  using size_type = typename std::deque<T>::size_type;

  enum class push_status {
    accepted,
    full,
    closed,
  };

  struct push_result {
    push_status status;
    size_type size;
  };

  explicit concurrent_bounded_queue(std::size_t capacity)
    : capacity_(capacity)
  {
  }

  concurrent_bounded_queue(const concurrent_bounded_queue&) = delete;
  concurrent_bounded_queue(concurrent_bounded_queue&&) = delete;
  auto operator=(const concurrent_bounded_queue&) -> concurrent_bounded_queue& = delete;
  auto operator=(concurrent_bounded_queue&&) -> concurrent_bounded_queue& = delete;
  ~concurrent_bounded_queue() = default;

  [[nodiscard]] auto capacity() const -> std::size_t
  {
    return capacity_;
  }

  auto size() const -> size_type
  {
    const std::scoped_lock lock(mutex_);
    return data_.size();
  }

  auto empty() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return data_.empty();
  }

  /**
   * @return whether the item has been accepted, and the queue size after the operation
   */
  auto try_push(T&& item) -> push_result
  {
    const std::scoped_lock lock(mutex_);
    if (closed_) {
      return { push_status::closed, data_.size() };
    }
    if (data_.size() >= capacity_) {
      ++dropped_count_;
      return { push_status::full, data_.size() };
    }
    data_.push_back(std::move(item));
    return { push_status::accepted, data_.size() };
  }

  /**
   * Stops accepting items. Every push that returned accepted before this call is visible to the
   * next pop_batch().
   */
  void close()
  {
    const std::scoped_lock lock(mutex_);
    closed_ = true;
  }

  auto is_closed() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return closed_;
  }

  /**
   * Removes up to @p max_items from the front of the queue, preserving their order.
   */
  auto pop_batch(std::size_t max_items) -> std::vector<T>
  {
    std::vector<T> batch;

    const std::scoped_lock lock(mutex_);
    auto count = std::min(max_items, data_.size());
    batch.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      batch.push_back(std::move(data_.front()));
      data_.pop_front();
    }
    return batch;
  }

  /**
   * Number of items rejected because the queue was full.
   */
  auto dropped_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return dropped_count_;
  }
};
} // namespace tinytrace::core::utils
