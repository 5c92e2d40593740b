/*
 * File:        filter_config.cpp
 * Module:      clipstack-core
 * Purpose:     YAML filter description
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "filter_config.h"
#include "combined_clip.h"
#include "logging.h"
#include "stage_registry.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>

namespace clipstack {

namespace {

const std::array<const char*, 7> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

bool is_log_level(const std::string& level) {
    return std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), level) != LOG_LEVELS.end();
}

ParameterValue parse_parameter(const std::string& name, const YAML::Node& node, const std::string& source) {
    if (!node.IsMap() || !node["value"]) {
        throw ConfigError("Invalid filter description '" + source + "': parameter '" + name +
                          "' must be a map with 'type' and 'value'");
    }

    const std::string type_str = node["type"].as<std::string>("string");
    auto type = parameter_util::type_from_name(type_str);
    if (!type) {
        throw ConfigError("Invalid filter description '" + source + "': parameter '" + name +
                          "' has unknown type '" + type_str + "'");
    }

    const YAML::Node value = node["value"];
    if (!value.IsScalar()) {
        throw ConfigError("Invalid filter description '" + source + "': parameter '" + name +
                          "' value must be a scalar");
    }

    auto parsed = parameter_util::string_to_value(value.Scalar(), *type);
    if (!parsed) {
        throw ConfigError("Invalid filter description '" + source + "': parameter '" + name +
                          "' value '" + value.Scalar() + "' is not a valid " + type_str);
    }
    return *parsed;
}

FilterConfig parse_root(const YAML::Node& root, const std::string& source) {
    FilterConfig config;

    if (!root.IsMap()) {
        throw ConfigError("Invalid filter description '" + source + "': expected a map at top level");
    }

    if (const YAML::Node logging = root["logging"]) {
        config.logging.level = logging["level"].as<std::string>(config.logging.level);
        config.logging.file = logging["file"].as<std::string>("");
        if (!is_log_level(config.logging.level)) {
            throw ConfigError("Invalid filter description '" + source + "': unknown log level '" +
                              config.logging.level + "'");
        }
    }

    // Validate filter section exists
    const YAML::Node filter = root["filter"];
    if (!filter) {
        throw ConfigError("Invalid filter description '" + source + "': missing required 'filter' section");
    }

    config.stage_name = filter["stage"].as<std::string>("");
    if (config.stage_name.empty()) {
        throw ConfigError("Invalid filter description '" + source + "': filter stage is required");
    }

    if (const YAML::Node params = filter["parameters"]) {
        if (!params.IsMap()) {
            throw ConfigError("Invalid filter description '" + source + "': 'parameters' must be a map");
        }
        for (const auto& param : params) {
            const std::string name = param.first.as<std::string>();
            config.parameters[name] = parse_parameter(name, param.second, source);
            CLIPSTACK_LOG_DEBUG("Loaded parameter '{}' = {}", name,
                                parameter_util::value_to_string(config.parameters[name]));
        }
    }

    if (const YAML::Node scheduler = root["scheduler"]) {
        config.scheduler.threads = scheduler["threads"].as<int32_t>(0);
        if (config.scheduler.threads < 0) {
            throw ConfigError("Invalid filter description '" + source + "': scheduler threads must not be negative");
        }
    }

    return config;
}

} // anonymous namespace

FilterConfig parse_filter_config(const std::string& text) {
    try {
        return parse_root(YAML::Load(text), "<string>");
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse filter description: ") + e.what());
    }
}

FilterConfig load_filter_config(const std::string& filename) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + filename + "': " + e.what());
    }

    try {
        return parse_root(root, filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid filter description '" + filename + "': " + e.what());
    }
}

std::string filter_config_to_yaml(const FilterConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "logging";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config.logging.level;
    if (!config.logging.file.empty()) {
        out << YAML::Key << "file" << YAML::Value << config.logging.file;
    }
    out << YAML::EndMap;

    out << YAML::Key << "filter";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "stage" << YAML::Value << config.stage_name;
    if (!config.parameters.empty()) {
        out << YAML::Key << "parameters";
        out << YAML::Value << YAML::BeginMap;
        for (const auto& [name, value] : config.parameters) {
            out << YAML::Key << name;
            out << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "type" << YAML::Value
                << parameter_util::type_name(parameter_util::type_of(value));
            out << YAML::Key << "value" << YAML::Value << parameter_util::value_to_string(value);
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "scheduler";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "threads" << YAML::Value << config.scheduler.threads;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

void apply_logging(const FilterConfig& config) {
    init_logging(config.logging.level,
                 "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                 config.logging.file);
}

VideoClipPtr build_filter(const FilterConfig& config, const std::vector<VideoClipPtr>& clips) {
    auto stage = StageRegistry::instance().create_stage(config.stage_name);

    CLIPSTACK_LOG_INFO("Building filter '{}' (version {}) on {} clip(s)",
                       config.stage_name, stage->version(), clips.size());

    return stage->execute(clips, config.parameters);
}

std::unique_ptr<FrameScheduler> build_scheduler(const FilterConfig& config, const VideoClipPtr& filter) {
    auto combined = std::dynamic_pointer_cast<const CombinedClip>(filter);
    if (!combined) {
        throw ConfigError("Scheduler requires a clip produced by a combine stage");
    }
    return std::make_unique<FrameScheduler>(combined->combiner(), config.scheduler.threads);
}

} // namespace clipstack
