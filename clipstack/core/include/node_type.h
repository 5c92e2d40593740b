// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025

#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace clipstack {

/**
 * @brief Metadata about a stage type
 *
 * Describes the characteristics of a combine stage for listing and
 * input-count validation.
 */
struct NodeTypeInfo {
    std::string stage_name;     // Type identifier (e.g., "Mean")
    std::string display_name;   // Human-readable name (e.g., "Per-pixel Mean")
    std::string description;    // Detailed description
    uint32_t min_inputs;        // Minimum number of input clips
    uint32_t max_inputs;        // Maximum number of input clips (UINT32_MAX for unlimited)

    /// True if a stage of this type can take `count` input clips
    bool accepts_inputs(size_t count) const {
        return count >= min_inputs && count <= max_inputs;
    }
};

} // namespace clipstack
