/*
 * File:        stage_registry.cpp
 * Module:      clipstack-core
 * Purpose:     Stage type registration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "stage_registry.h"
#include <algorithm>

namespace clipstack {

// Forward declaration of force linking function
void force_stage_linking();

StageRegistry& StageRegistry::instance() {
    static StageRegistry registry;
    static bool initialized = false;
    if (!initialized) {
        initialized = true;
        force_stage_linking();
    }
    return registry;
}

void StageRegistry::register_stage(const std::string& stage_name, StageFactory factory) {
    if (factories_.find(stage_name) != factories_.end()) {
        throw StageRegistryError("Stage already registered: " + stage_name);
    }
    factories_[stage_name] = std::move(factory);
}

CombineStagePtr StageRegistry::create_stage(const std::string& stage_name) const {
    auto it = factories_.find(stage_name);
    if (it == factories_.end()) {
        throw StageRegistryError("Unknown stage: " + stage_name);
    }
    return it->second();
}

bool StageRegistry::has_stage(const std::string& stage_name) const {
    return factories_.find(stage_name) != factories_.end();
}

std::vector<std::string> StageRegistry::get_registered_stages() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& pair : factories_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace clipstack
