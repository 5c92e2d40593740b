/*
 * File:        stage_init.cpp
 * Module:      clipstack-core
 * Purpose:     Stage initialization
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "stages/mean/mean_stage.h"
#include "stages/median/median_stage.h"
#include <memory>

namespace clipstack {

/**
 * @brief Force linking of all stage object files
 *
 * Creates dummy instances so the linker keeps every stage object file,
 * which ensures their static registrations execute. Called by
 * StageRegistry::instance() before any lookup.
 */
void force_stage_linking() {
    [[maybe_unused]] auto dummy1 = std::make_shared<MeanStage>();
    [[maybe_unused]] auto dummy2 = std::make_shared<MedianStage>();
}

} // namespace clipstack
