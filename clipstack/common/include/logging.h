/*
 * File:        logging.h
 * Module:      clipstack-common
 * Purpose:     Shared logging convenience header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace clipstack {

/// Initialize the logging system
/// Can be called again to reconfigure (e.g. after a config file is loaded)
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the library logger (created on first use)
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

/// Drop the logger (it will be recreated on next use)
void reset_logging();

} // namespace clipstack

// Convenient logging macros
#define CLIPSTACK_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(clipstack::get_logger(), __VA_ARGS__)
#define CLIPSTACK_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(clipstack::get_logger(), __VA_ARGS__)
#define CLIPSTACK_LOG_INFO(...)     SPDLOG_LOGGER_INFO(clipstack::get_logger(), __VA_ARGS__)
#define CLIPSTACK_LOG_WARN(...)     SPDLOG_LOGGER_WARN(clipstack::get_logger(), __VA_ARGS__)
#define CLIPSTACK_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(clipstack::get_logger(), __VA_ARGS__)
#define CLIPSTACK_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(clipstack::get_logger(), __VA_ARGS__)
