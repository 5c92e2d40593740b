/*
 * File:        stage_registry.h
 * Module:      clipstack-core
 * Purpose:     Stage type registration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "../stages/stage.h"
#include <memory>
#include <string>
#include <functional>
#include <map>
#include <stdexcept>
#include <vector>

namespace clipstack {

/**
 * @brief Exception thrown when stage cannot be created
 */
class StageRegistryError : public std::runtime_error {
public:
    explicit StageRegistryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Factory for creating combine stages by name
 *
 * The registry maps stage names (strings) to factory functions that create
 * stage instances. This lets a filter description name its stage.
 *
 * Usage:
 * ```cpp
 * auto& registry = StageRegistry::instance();
 * auto stage = registry.create_stage("Mean");
 * ```
 *
 * Thread safety: Not thread-safe. Register stages during initialization only.
 */
class StageRegistry {
public:
    using StageFactory = std::function<CombineStagePtr()>;

    /**
     * @brief Get singleton instance
     */
    static StageRegistry& instance();

    /**
     * @brief Register a stage factory
     *
     * @param stage_name Unique name for this stage (e.g., "Mean")
     * @param factory Function that creates a new stage instance
     * @throws StageRegistryError if stage_name already registered
     */
    void register_stage(const std::string& stage_name, StageFactory factory);

    /**
     * @brief Create a stage instance by name
     *
     * @throws StageRegistryError if stage_name not found
     */
    CombineStagePtr create_stage(const std::string& stage_name) const;

    bool has_stage(const std::string& stage_name) const;

    /**
     * @brief Get list of all registered stage names, sorted
     */
    std::vector<std::string> get_registered_stages() const;

private:
    StageRegistry() = default;
    StageRegistry(const StageRegistry&) = delete;
    StageRegistry& operator=(const StageRegistry&) = delete;

    std::map<std::string, StageFactory> factories_;
};

/**
 * @brief Helper for auto-registering stages
 *
 * Queries the stage for its name via get_node_type_info(), so the
 * registered name cannot drift from the stage's own.
 */
class StageRegistration {
public:
    StageRegistration(StageRegistry::StageFactory factory) {
        // Create a temporary instance to get the stage name
        auto temp_stage = factory();
        std::string stage_name = temp_stage->get_node_type_info().stage_name;
        StageRegistry::instance().register_stage(stage_name, factory);
    }
};

} // namespace clipstack

/// Register a default-constructible stage class from its implementation file
#define CLIPSTACK_REGISTER_STAGE(StageClass) \
    static ::clipstack::StageRegistration StageClass##_registration([]() { \
        return std::make_shared<StageClass>(); \
    });
