/*
 * File:        error_codes.h
 * Module:      clipstack-common
 * Purpose:     Common error codes and status enums
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>

namespace clipstack {

/**
 * @brief Result codes for per-frame operations
 *
 * Frame requests that fail report one of these instead of aborting
 * the whole run; see FrameScheduler.
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_INVALID_ARGUMENT = -1,
    ERROR_SOURCE_FRAME = -2,
    ERROR_INVALID_FORMAT = -4,
    ERROR_INTERNAL = -7,
    ERROR_CANCELLED = -10,
    ERROR_UNKNOWN = -99
};

/**
 * @brief Check if a result code indicates success
 */
inline bool is_success(ResultCode code) {
    return code == ResultCode::SUCCESS;
}

/**
 * @brief Check if a result code indicates an error
 */
inline bool is_error(ResultCode code) {
    return code != ResultCode::SUCCESS;
}

/**
 * @brief Short name for a result code (for log output)
 */
inline const char* result_code_name(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS: return "SUCCESS";
        case ResultCode::ERROR_INVALID_ARGUMENT: return "ERROR_INVALID_ARGUMENT";
        case ResultCode::ERROR_SOURCE_FRAME: return "ERROR_SOURCE_FRAME";
        case ResultCode::ERROR_INVALID_FORMAT: return "ERROR_INVALID_FORMAT";
        case ResultCode::ERROR_INTERNAL: return "ERROR_INTERNAL";
        case ResultCode::ERROR_CANCELLED: return "ERROR_CANCELLED";
        case ResultCode::ERROR_UNKNOWN: return "ERROR_UNKNOWN";
    }
    return "ERROR_UNKNOWN";
}

} // namespace clipstack
