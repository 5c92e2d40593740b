/*
 * File:        combine_errors.cpp
 * Module:      clipstack-core
 * Purpose:     Exceptions raised while building or running a combine
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "combine_errors.h"
#include <fmt/format.h>

namespace clipstack {

FormatMismatchError::FormatMismatchError(size_t first_index, size_t second_index, std::string attribute)
    : CombineError(fmt::format("Input clips {} and {} differ in {}; all clips must share format, "
                               "frame rate, resolution and frame count",
                               first_index, second_index, attribute))
    , first_index_(first_index)
    , second_index_(second_index)
    , attribute_(std::move(attribute))
{
}

SourceFrameError::SourceFrameError(size_t clip_index, uint64_t frame_index, const std::string& reason)
    : CombineError(fmt::format("Could not retrieve frame {} from clip {}: {}", frame_index, clip_index, reason))
    , clip_index_(clip_index)
    , frame_index_(frame_index)
{
}

} // namespace clipstack
