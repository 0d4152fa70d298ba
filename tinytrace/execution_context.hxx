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

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tinytrace
{
class span;

/**
 * Logical execution context of one request (or of one task spawned by it).
 *
 * The context holds the stack of spans bound while the request runs, the top of which is the
 * parent of any span started without an explicit parent. Contexts are never shared between
 * sibling requests: each inbound request gets its own, and child tasks get a fork.
 *
 * A thread only points at the context it is currently running. The pointer is switched with
 * @ref scope (or by handlers produced by @ref attach and @ref wrap), so a request can hop between
 * worker threads and keep its current span. A thread that runs no context at all falls back to a
 * per-thread default context.
 */
class execution_context : public std::enable_shared_from_this<execution_context>
{
  struct private_tag {
  };

public:
  /**
   * Restores the previously current span when released or destroyed. Bindings must be released
   * in the reverse order of their creation.
   */
  class binding_guard
  {
  public:
    binding_guard() = default;
    binding_guard(const binding_guard& other) = delete;
    auto operator=(const binding_guard& other) -> binding_guard& = delete;
    binding_guard(binding_guard&& other) noexcept;
    auto operator=(binding_guard&& other) noexcept -> binding_guard&;
    ~binding_guard();

    void release();

    [[nodiscard]] auto is_active() const -> bool
    {
      return context_ != nullptr;
    }

  private:
    friend class execution_context;

    binding_guard(std::shared_ptr<execution_context> context,
                  std::shared_ptr<span> bound,
                  std::size_t depth);

    std::shared_ptr<execution_context> context_{};
    std::shared_ptr<span> span_{};
    std::size_t depth_{ 0 };
  };

  /**
   * Makes a context the one the calling thread is running, until destroyed.
   */
  class scope
  {
  public:
    explicit scope(std::shared_ptr<execution_context> context);
    scope(const scope& other) = delete;
    scope(scope&& other) = delete;
    auto operator=(const scope& other) -> scope& = delete;
    auto operator=(scope&& other) -> scope& = delete;
    ~scope();

  private:
    std::shared_ptr<execution_context> previous_;
  };

  explicit execution_context(private_tag /* tag */)
  {
  }

  static auto create() -> std::shared_ptr<execution_context>;

  /**
   * @return the context the calling thread is running
   */
  static auto current() -> std::shared_ptr<execution_context>;

  /**
   * @return the top of the current context's stack, or nullptr when nothing is bound
   */
  static auto current_span() -> std::shared_ptr<span>;

  [[nodiscard]] auto bind(std::shared_ptr<span> bound) -> binding_guard;

  [[nodiscard]] auto active_span() const -> std::shared_ptr<span>;

  [[nodiscard]] auto depth() const -> std::size_t;

  /**
   * New context for a child task. Its stack starts with this context's active span, and evolves
   * independently afterwards.
   */
  [[nodiscard]] auto fork() const -> std::shared_ptr<execution_context>;

  /**
   * Runs the function with this context installed on the calling thread.
   */
  template<typename Function>
  auto run(Function&& function) -> decltype(std::forward<Function>(function)())
  {
    scope installed{ shared_from_this() };
    return std::forward<Function>(function)();
  }

  /**
   * Binds a continuation of this context's task: whichever thread invokes the returned handler
   * runs it with this context installed.
   */
  template<typename Handler>
  auto attach(Handler&& handler)
  {
    return [context = shared_from_this(),
            handler = std::forward<Handler>(handler)](auto&&... args) mutable -> decltype(auto) {
      scope installed{ context };
      return handler(std::forward<decltype(args)>(args)...);
    };
  }

  /**
   * Binds a child task to a fork of the calling thread's current context.
   */
  template<typename Handler>
  static auto wrap(Handler&& handler)
  {
    return current()->fork()->attach(std::forward<Handler>(handler));
  }

private:
  void release(const std::shared_ptr<span>& bound, std::size_t depth);

  mutable std::mutex mutex_{};
  std::vector<std::shared_ptr<span>> stack_{};
};
} // namespace tinytrace
