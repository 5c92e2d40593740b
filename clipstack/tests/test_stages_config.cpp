/******************************************************************************
 * test_stages_config.cpp
 *
 * Tests for the Mean / Median stages, the stage registry and YAML filter
 * descriptions
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 ******************************************************************************/

#include "combine_errors.h"
#include "combined_clip.h"
#include "filter_config.h"
#include "logging.h"
#include "mean_stage.h"
#include "median_stage.h"
#include "stage_registry.h"
#include "test_clips.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace clipstack;
using namespace clipstack::test;

namespace {

std::vector<VideoClipPtr> three_clips() {
    auto a = constant_clip<uint8_t>("a", yuv420(8), 8, 8, 2, 10, "I");
    auto b = constant_clip<uint8_t>("b", yuv420(8), 8, 8, 2, 20, "B");
    auto c = constant_clip<uint8_t>("c", yuv420(8), 8, 8, 2, 30, "B");
    return as_inputs({a, b, c});
}

} // anonymous namespace

void test_registry() {
    auto& registry = StageRegistry::instance();
    auto names = registry.get_registered_stages();
    assert(names.size() == 2);
    assert(names[0] == "Mean");
    assert(names[1] == "Median");
    assert(registry.has_stage("Mean"));
    assert(!registry.has_stage("Average"));

    auto stage = registry.create_stage("Median");
    assert(stage->get_node_type_info().stage_name == "Median");

    bool threw = false;
    try {
        registry.create_stage("Average");
    } catch (const StageRegistryError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.register_stage("Mean", []() { return std::make_shared<MeanStage>(); });
    } catch (const StageRegistryError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_registry: PASSED\n";
}

void test_mean_stage_parameters() {
    MeanStage stage;
    auto params = stage.get_parameters();
    assert(std::get<int32_t>(params.at("preset")) == 0);
    assert(std::get<int32_t>(params.at("discard")) == 0);
    assert(stage.get_parameter_descriptors().size() == 2);

    assert(stage.set_parameters({{"preset", int32_t(2)}}));
    assert(std::get<int32_t>(stage.get_parameters().at("preset")) == 2);

    // Rejected values leave the stage unchanged
    assert(!stage.set_parameters({{"discard", int32_t(1)}}));         // preset already set
    assert(!stage.set_parameters({{"preset", std::string("two")}}));
    assert(!stage.set_parameters({{"discard", int32_t(-1)}}));
    assert(!stage.set_parameters({{"radius", int32_t(1)}}));
    assert(std::get<int32_t>(stage.get_parameters().at("preset")) == 2);

    assert(stage.set_parameters({{"preset", int32_t(0)}, {"discard", int32_t(1)}}));

    MedianStage median;
    assert(median.set_parameters({}));
    assert(!median.set_parameters({{"preset", int32_t(1)}}));

    std::cout << "test_mean_stage_parameters: PASSED\n";
}

void test_parameter_validation() {
    MeanStage stage;
    const auto descriptors = stage.get_parameter_descriptors();
    std::string error;

    assert(parameter_util::validate(descriptors, {{"preset", int32_t(3)}, {"discard", int32_t(0)}}, error));
    assert(!parameter_util::validate(descriptors, {{"discard", int32_t(-1)}}, error));
    assert(error.find("minimum") != std::string::npos);
    assert(!parameter_util::validate(descriptors, {{"preset", uint32_t(1)}}, error));
    assert(error.find("int32") != std::string::npos);
    assert(!parameter_util::validate(descriptors, {{"radius", int32_t(1)}}, error));
    assert(error.find("radius") != std::string::npos);

    // Median describes no parameters, so any value is rejected
    MedianStage median;
    assert(parameter_util::validate(median.get_parameter_descriptors(), {}, error));
    assert(!parameter_util::validate(median.get_parameter_descriptors(), {{"discard", int32_t(0)}}, error));

    assert(parameter_util::type_of(ParameterValue(2.5)) == ParameterType::DOUBLE);
    assert(parameter_util::type_of(ParameterValue(std::string("x"))) == ParameterType::STRING);
    assert(*parameter_util::string_to_value("-4", ParameterType::INT32) == ParameterValue(int32_t(-4)));
    assert(!parameter_util::string_to_value("4x", ParameterType::INT32));
    assert(!parameter_util::string_to_value("-1", ParameterType::UINT32));
    assert(*parameter_util::string_to_value("yes", ParameterType::BOOL) == ParameterValue(true));
    assert(parameter_util::value_to_string(ParameterValue(0.1)) == "0.1");

    // Input counts are checked against the stage's node type
    assert(stage.get_node_type_info().accepts_inputs(1));
    assert(!stage.get_node_type_info().accepts_inputs(0));
    for (bool use_median : {false, true}) {
        bool threw = false;
        try {
            if (use_median) {
                median.execute({}, {});
            } else {
                stage.execute({}, {});
            }
        } catch (const InvalidArgumentError& e) {
            threw = true;
            assert(std::string(e.what()).find("input clip") != std::string::npos);
        }
        assert(threw);
    }

    std::cout << "test_parameter_validation: PASSED\n";
}

void test_stage_execute() {
    auto inputs = three_clips();

    MeanStage mean;
    auto out = mean.execute(inputs, {{"preset", int32_t(1)}});
    assert(out->video_info().format == yuv420(8));
    assert(out->frame_count() == 2);
    assert(out->id().value() == "Mean(a,b,c)");
    assert(out->provenance().stage_name == "Mean");
    assert(out->provenance().stage_version == "1.0");
    assert(out->provenance().parameters.at("preset") == "1");
    assert(out->provenance().input_artifacts.size() == 3);
    assert(frame_is_constant<uint8_t>(*out->get_frame(1), 18));

    MedianStage median;
    auto med = median.execute(inputs, {});
    assert(frame_is_constant<uint8_t>(*med->get_frame(0), 20));

    // Frame failures are reported as a missing frame by the clip
    assert(med->get_frame(2) == nullptr);

    bool threw = false;
    try {
        MeanStage bad;
        bad.execute(inputs, {{"discard", int32_t(5)}});
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        MedianStage bad;
        bad.execute(inputs, {{"preset", int32_t(1)}});
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_stage_execute: PASSED\n";
}

void test_parse_config() {
    const std::string text =
        "logging:\n"
        "  level: debug\n"
        "filter:\n"
        "  stage: Mean\n"
        "  parameters:\n"
        "    preset: { type: int32, value: 1 }\n"
        "scheduler:\n"
        "  threads: 3\n";

    FilterConfig config = parse_filter_config(text);
    assert(config.logging.level == "debug");
    assert(config.logging.file.empty());
    assert(config.stage_name == "Mean");
    assert(std::get<int32_t>(config.parameters.at("preset")) == 1);
    assert(config.scheduler.threads == 3);

    // Defaults
    FilterConfig minimal = parse_filter_config("filter:\n  stage: Median\n");
    assert(minimal.logging.level == "info");
    assert(minimal.parameters.empty());
    assert(minimal.scheduler.threads == 0);

    // Serialized form parses back to the same description, for every value type
    config.parameters["gain"] = 0.1;
    config.parameters["label"] = std::string("grain test");
    config.parameters["enabled"] = true;
    config.parameters["count"] = uint32_t(7);
    FilterConfig again = parse_filter_config(filter_config_to_yaml(config));
    assert(again.stage_name == config.stage_name);
    assert(again.logging.level == config.logging.level);
    assert(again.scheduler.threads == config.scheduler.threads);
    assert(again.parameters == config.parameters);

    std::cout << "test_parse_config: PASSED\n";
}

void test_malformed_config() {
    const char* bad_documents[] = {
        "",                                                     // empty
        "- just\n- a list\n",                                   // not a map
        "logging:\n  level: info\n",                            // no filter
        "filter:\n  parameters: {}\n",                          // no stage
        "filter:\n  stage: Mean\n  parameters:\n    preset: 1\n",                          // bare value
        "filter:\n  stage: Mean\n  parameters:\n    preset: { type: int64, value: 1 }\n",  // unknown type
        "filter:\n  stage: Mean\n  parameters:\n    preset: { type: int32, value: x }\n",  // bad value
        "filter:\n  stage: Mean\n  parameters:\n    preset: { type: int32, value: [1, 2] }\n",
        "filter:\n  stage: Mean\nscheduler:\n  threads: -2\n",
        "logging:\n  level: loud\nfilter:\n  stage: Mean\n",
        "filter: [unclosed\n",
    };

    for (const char* doc : bad_documents) {
        bool threw = false;
        try {
            parse_filter_config(doc);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        load_filter_config("/nonexistent/clipstack/filter.yaml");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_malformed_config: PASSED\n";
}

void test_log_level_names() {
    set_log_level("DEBUG");
    assert(get_logger()->level() == spdlog::level::debug);
    set_log_level("Warning");
    assert(get_logger()->level() == spdlog::level::warn);

    // Bytes outside ASCII are not a level name and fall back to info
    set_log_level("d\xC3\xA9bug");
    assert(get_logger()->level() == spdlog::level::info);

    reset_logging();
    std::cout << "test_log_level_names: PASSED\n";
}

void test_config_file_end_to_end() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "clipstack_test_stages_config";
    fs::create_directories(dir);
    const fs::path config_path = dir / "filter.yaml";
    const fs::path log_path = dir / "clipstack.log";

    {
        std::ofstream out(config_path);
        out << "logging:\n"
            << "  level: trace\n"
            << "  file: " << log_path.string() << "\n"
            << "filter:\n"
            << "  stage: Mean\n"
            << "  parameters:\n"
            << "    discard: { type: int32, value: 1 }\n"
            << "scheduler:\n"
            << "  threads: 2\n";
    }

    FilterConfig config = load_filter_config(config_path.string());
    apply_logging(config);
    assert(get_logger()->level() == spdlog::level::trace);

    std::vector<std::shared_ptr<MemoryClip>> clips;
    const uint8_t values[] = {0, 10, 20, 30, 255};
    for (int i = 0; i < 5; ++i) {
        clips.push_back(constant_clip<uint8_t>("k" + std::to_string(i), gray(8), 8, 4, 3, values[i]));
    }

    auto filter = build_filter(config, as_inputs(clips));
    auto scheduler = build_scheduler(config, filter);
    assert(scheduler->thread_count() == 2);

    auto results = scheduler->render_all();
    assert(results.size() == 3);
    for (const auto& r : results) {
        assert(r.ok());
        assert(frame_is_constant<uint8_t>(*r.frame, 20));
    }

    get_logger()->flush();
    assert(fs::exists(log_path));
    assert(fs::file_size(log_path) > 0);

    // Only clips built by a stage can be scheduled
    bool threw = false;
    try {
        build_scheduler(config, clips[0]);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    // Unknown stage names fail at build time
    FilterConfig unknown = config;
    unknown.stage_name = "Blend";
    threw = false;
    try {
        build_filter(unknown, as_inputs(clips));
    } catch (const StageRegistryError&) {
        threw = true;
    }
    assert(threw);

    reset_logging();
    fs::remove_all(dir);

    std::cout << "test_config_file_end_to_end: PASSED\n";
}

int main() {
    std::cout << "Running stage and configuration tests...\n";

    test_registry();
    test_mean_stage_parameters();
    test_parameter_validation();
    test_stage_execute();
    test_parse_config();
    test_malformed_config();
    test_log_level_names();
    test_config_file_end_to_end();

    std::cout << "All stage and configuration tests passed!\n";
    return 0;
}
