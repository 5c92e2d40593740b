/******************************************************************************
 * artifact.h
 *
 * Artifact identity, provenance, and base class for clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <map>

namespace clipstack {

/**
 * @brief Identifier for artifacts
 *
 * Source clips are named by their creator; combined clips derive their ID
 * from the stage name and the IDs of their inputs.
 */
class ArtifactID {
public:
    using value_type = std::string;

    ArtifactID() = default;
    explicit ArtifactID(value_type id) : id_(std::move(id)) {}

    const value_type& value() const { return id_; }
    bool is_valid() const { return !id_.empty(); }

    bool operator==(const ArtifactID& other) const { return id_ == other.id_; }
    bool operator!=(const ArtifactID& other) const { return id_ != other.id_; }
    bool operator<(const ArtifactID& other) const { return id_ < other.id_; }

    std::string to_string() const { return id_; }

private:
    value_type id_;
};

/**
 * @brief Provenance information for an artifact
 *
 * Records how an artifact was created.
 */
struct Provenance {
    std::string stage_name;              // e.g., "Mean"
    std::string stage_version;           // Algorithm version
    std::map<std::string, std::string> parameters;  // Stage parameters

    // Input artifacts
    std::vector<ArtifactID> input_artifacts;

    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Base class for all artifacts
 *
 * Artifacts are immutable once created and carry identity and provenance.
 */
class Artifact {
public:
    virtual ~Artifact() = default;

    const ArtifactID& id() const { return id_; }
    const Provenance& provenance() const { return provenance_; }

    // Type information (RTTI alternative for logging)
    virtual std::string type_name() const = 0;

protected:
    Artifact(ArtifactID id, Provenance prov)
        : id_(std::move(id)), provenance_(std::move(prov)) {}

private:
    ArtifactID id_;
    Provenance provenance_;
};

using ArtifactPtr = std::shared_ptr<Artifact>;

} // namespace clipstack
