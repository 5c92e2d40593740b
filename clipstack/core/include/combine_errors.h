/*
 * File:        combine_errors.h
 * Module:      clipstack-core
 * Purpose:     Exceptions raised while building or running a combine
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace clipstack {

/**
 * @brief Base class for all combine errors
 */
class CombineError : public std::runtime_error {
public:
    explicit CombineError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Input clips disagree on format, geometry, frame rate or length
 *
 * Raised at construction; no frame is ever produced.
 */
class FormatMismatchError : public CombineError {
public:
    FormatMismatchError(size_t first_index, size_t second_index, std::string attribute);

    size_t first_index() const { return first_index_; }
    size_t second_index() const { return second_index_; }
    const std::string& attribute() const { return attribute_; }

private:
    size_t first_index_;
    size_t second_index_;
    std::string attribute_;
};

/**
 * @brief The combine mode cannot process the clips' sample representation
 */
class UnsupportedFormatError : public CombineError {
public:
    explicit UnsupportedFormatError(const std::string& msg) : CombineError(msg) {}
};

/**
 * @brief A source frame could not be fetched for one output frame request
 *
 * Local to that request; other frame indices are unaffected.
 */
class SourceFrameError : public CombineError {
public:
    SourceFrameError(size_t clip_index, uint64_t frame_index, const std::string& reason);

    size_t clip_index() const { return clip_index_; }
    uint64_t frame_index() const { return frame_index_; }

private:
    size_t clip_index_;
    uint64_t frame_index_;
};

/**
 * @brief Invalid construction parameter or request argument
 */
class InvalidArgumentError : public CombineError {
public:
    explicit InvalidArgumentError(const std::string& msg) : CombineError(msg) {}
};

} // namespace clipstack
