/*
 * File:        combined_clip.cpp
 * Module:      clipstack-core
 * Purpose:     Output clip whose frames are combined on demand
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "combined_clip.h"
#include "combine_errors.h"
#include "logging.h"
#include <chrono>

namespace clipstack {

CombinedClip::CombinedClip(std::shared_ptr<const FrameCombiner> combiner, ArtifactID id, Provenance prov)
    : VideoClip(std::move(id), std::move(prov))
    , combiner_(std::move(combiner))
{
    if (!combiner_) {
        throw InvalidArgumentError("CombinedClip requires a combiner");
    }
}

VideoFramePtr CombinedClip::get_frame(uint64_t n) const {
    try {
        return combiner_->combine(n);
    } catch (const CombineError& e) {
        CLIPSTACK_LOG_ERROR("CombinedClip '{}': {}", id().value(), e.what());
        return nullptr;
    }
}

VideoClipPtr make_combined_clip(CombineConfigPtr config,
                                const std::string& stage_name,
                                const std::string& stage_version,
                                const std::map<std::string, std::string>& parameters)
{
    if (!config) {
        throw InvalidArgumentError("make_combined_clip requires a configuration");
    }

    Provenance prov;
    prov.stage_name = stage_name;
    prov.stage_version = stage_version;
    prov.parameters = parameters;
    prov.created_at = std::chrono::system_clock::now();

    std::string id = stage_name + "(";
    for (size_t i = 0; i < config->clips.size(); ++i) {
        const ArtifactID& input_id = config->clips[i]->id();
        prov.input_artifacts.push_back(input_id);
        if (i > 0) {
            id += ",";
        }
        id += input_id.value();
    }
    id += ")";

    auto combiner = std::make_shared<const FrameCombiner>(std::move(config));
    return std::make_shared<const CombinedClip>(std::move(combiner), ArtifactID(id), std::move(prov));
}

} // namespace clipstack
