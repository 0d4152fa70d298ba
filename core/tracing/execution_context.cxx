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

#include <tinytrace/execution_context.hxx>
#include <tinytrace/fmt/span_context.hxx>
#include <tinytrace/span.hxx>

#include "core/logger/logger.hxx"
#include "usage_error.hxx"

#include <fmt/core.h>

#include <memory>
#include <mutex>
#include <utility>

namespace tinytrace
{
namespace
{
thread_local std::shared_ptr<execution_context> installed_context{};
thread_local std::shared_ptr<execution_context> thread_default_context{};

void
log_binding(const char* action, const span& bound, std::size_t depth)
{
  if (bound.event_detail() == span_event_detail::none) {
    return;
  }
  TT_LOG_INFO("{} span \"{}\" trace_id={}, span_id={}, depth={}",
              action,
              bound.name(),
              bound.context().trace_id(),
              bound.context().span_id(),
              depth);
}
} // namespace

execution_context::binding_guard::binding_guard(std::shared_ptr<execution_context> context,
                                                std::shared_ptr<span> bound,
                                                std::size_t depth)
  : context_{ std::move(context) }
  , span_{ std::move(bound) }
  , depth_{ depth }
{
}

execution_context::binding_guard::binding_guard(binding_guard&& other) noexcept
  : context_{ std::move(other.context_) }
  , span_{ std::move(other.span_) }
  , depth_{ other.depth_ }
{
  other.context_.reset();
}

auto
execution_context::binding_guard::operator=(binding_guard&& other) noexcept -> binding_guard&
{
  if (this != &other) {
    release();
    context_ = std::move(other.context_);
    span_ = std::move(other.span_);
    depth_ = other.depth_;
    other.context_.reset();
  }
  return *this;
}

execution_context::binding_guard::~binding_guard()
{
  release();
}

void
execution_context::binding_guard::release()
{
  if (!context_) {
    return;
  }
  auto context = std::move(context_);
  context->release(span_, depth_);
  span_.reset();
}

execution_context::scope::scope(std::shared_ptr<execution_context> context)
  : previous_{ std::exchange(installed_context, std::move(context)) }
{
}

execution_context::scope::~scope()
{
  installed_context = std::move(previous_);
}

auto
execution_context::create() -> std::shared_ptr<execution_context>
{
  return std::make_shared<execution_context>(private_tag{});
}

auto
execution_context::current() -> std::shared_ptr<execution_context>
{
  if (installed_context) {
    return installed_context;
  }
  if (!thread_default_context) {
    thread_default_context = create();
  }
  return thread_default_context;
}

auto
execution_context::current_span() -> std::shared_ptr<span>
{
  return current()->active_span();
}

auto
execution_context::bind(std::shared_ptr<span> bound) -> binding_guard
{
  std::size_t depth{};
  {
    const std::scoped_lock lock(mutex_);
    depth = stack_.size();
    stack_.push_back(bound);
  }
  log_binding("enter", *bound, depth);
  return { shared_from_this(), std::move(bound), depth };
}

void
execution_context::release(const std::shared_ptr<span>& bound, std::size_t depth)
{
  {
    const std::scoped_lock lock(mutex_);
    if (stack_.size() <= depth || stack_[depth] != bound) {
      core::tracing::report_usage_error(
        fmt::format("binding of span \"{}\" (span_id={}) released after an enclosing binding",
                    bound->name(),
                    bound->context().span_id()));
      return;
    }
    if (stack_.size() != depth + 1) {
      core::tracing::report_usage_error(
        fmt::format("binding of span \"{}\" (span_id={}) released while {} nested binding(s) are "
                    "still active",
                    bound->name(),
                    bound->context().span_id(),
                    stack_.size() - depth - 1));
    }
    stack_.resize(depth);
  }
  log_binding("exit", *bound, depth);
}

auto
execution_context::active_span() const -> std::shared_ptr<span>
{
  const std::scoped_lock lock(mutex_);
  if (stack_.empty()) {
    return nullptr;
  }
  return stack_.back();
}

auto
execution_context::depth() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return stack_.size();
}

auto
execution_context::fork() const -> std::shared_ptr<execution_context>
{
  auto child = create();
  if (auto parent = active_span(); parent) {
    child->stack_.push_back(std::move(parent));
  }
  return child;
}
} // namespace tinytrace
