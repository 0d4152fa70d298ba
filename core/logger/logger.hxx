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

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed
 *   during runtime. Replacing the logger (create_*_logger, reset) is expected
 *   to happen during application start-up, before request threads are spawned.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tinytrace::core::logger
{
struct configuration;

auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger with the file (and optionally console and custom) sinks.
 *
 * The default level for the created logger is set to INFO
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which don't need any output (but may call
 * methods who tries to fetch the logger)
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 */
void
create_console_logger();

/**
 * Get the underlying logger object
 *
 * This will return null if a logger has not been initialized.
 */
auto
get() -> spdlog::logger*;

/**
 * Reset the underlying logger object
 */
void
reset();

/**
 * Check the log level of all spdLoggers is equal to the given level
 */
auto
check_log_levels(level lvl) -> bool;

/**
 * Set the log level of all registered spdLoggers
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current
 * configuration.
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

/**
 * Logs a formatted message at a specific severity level.
 */
template<typename... Args>
inline void
log(const char* file,
    int line,
    const char* function,
    level lvl,
    fmt::format_string<Args...> msg,
    Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_
 * loggers (you'd need to create new loggers after this method)
 */
void
shutdown();

/**
 * @return whether or not the logger has been initialized
 */
auto
is_initialized() -> bool;

} // namespace tinytrace::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define TINYTRACE_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define TINYTRACE_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * We implement this macro to avoid having argument evaluation performed
 * on log messages which likely will not actually be logged due to their
 * severity value not matching the logger.
 */
#define TINYTRACE_LOG(file, line, function, severity, ...)                                         \
  do {                                                                                             \
    if (tinytrace::core::logger::should_log(severity)) {                                           \
      tinytrace::core::logger::log(file, line, function, severity, __VA_ARGS__);                   \
    }                                                                                              \
  } while (false)

#define TT_LOG_TRACE(...)                                                                          \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::trace,                                             \
                __VA_ARGS__)
#define TT_LOG_DEBUG(...)                                                                          \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::debug,                                             \
                __VA_ARGS__)
#define TT_LOG_INFO(...)                                                                           \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::info,                                              \
                __VA_ARGS__)
#define TT_LOG_WARNING(...)                                                                        \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::warn,                                              \
                __VA_ARGS__)
#define TT_LOG_ERROR(...)                                                                          \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::err,                                               \
                __VA_ARGS__)
#define TT_LOG_CRITICAL(...)                                                                       \
  TINYTRACE_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                TINYTRACE_LOGGER_FUNCTION,                                                         \
                tinytrace::core::logger::level::critical,                                          \
                __VA_ARGS__)
