/*
 * File:        stage_parameter.cpp
 * Module:      clipstack-core
 * Purpose:     Stage parameter conversion helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "stage_parameter.h"
#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace clipstack {
namespace parameter_util {

std::string value_to_string(const ParameterValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", arg);
        } else {
            return std::to_string(arg);
        }
    }, value);
}

std::optional<ParameterValue> string_to_value(const std::string& str, ParameterType type) {
    try {
        size_t used = 0;
        switch (type) {
            case ParameterType::INT32: {
                long long v = std::stoll(str, &used);
                if (used != str.size() ||
                    v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
                    return std::nullopt;
                }
                return static_cast<int32_t>(v);
            }
            case ParameterType::UINT32: {
                if (!str.empty() && str[0] == '-') return std::nullopt;
                unsigned long long v = std::stoull(str, &used);
                if (used != str.size() || v > std::numeric_limits<uint32_t>::max()) {
                    return std::nullopt;
                }
                return static_cast<uint32_t>(v);
            }
            case ParameterType::DOUBLE: {
                double v = std::stod(str, &used);
                if (used != str.size()) return std::nullopt;
                return v;
            }
            case ParameterType::BOOL:
                if (str == "true" || str == "1" || str == "yes") return true;
                if (str == "false" || str == "0" || str == "no") return false;
                return std::nullopt;
            case ParameterType::STRING:
                return str;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

ParameterType type_of(const ParameterValue& value) {
    switch (value.index()) {
        case 0: return ParameterType::INT32;
        case 1: return ParameterType::UINT32;
        case 2: return ParameterType::DOUBLE;
        case 3: return ParameterType::BOOL;
        default: return ParameterType::STRING;
    }
}

const char* type_name(ParameterType type) {
    switch (type) {
        case ParameterType::INT32: return "int32";
        case ParameterType::UINT32: return "uint32";
        case ParameterType::DOUBLE: return "double";
        case ParameterType::BOOL: return "bool";
        case ParameterType::STRING: return "string";
    }
    return "unknown";
}

std::optional<ParameterType> type_from_name(const std::string& name) {
    if (name == "int32") return ParameterType::INT32;
    if (name == "uint32") return ParameterType::UINT32;
    if (name == "double") return ParameterType::DOUBLE;
    if (name == "bool") return ParameterType::BOOL;
    if (name == "string") return ParameterType::STRING;
    return std::nullopt;
}

bool validate(const std::vector<ParameterDescriptor>& descriptors,
              const std::map<std::string, ParameterValue>& params,
              std::string& error) {
    for (const auto& [name, value] : params) {
        auto desc = std::find_if(descriptors.begin(), descriptors.end(),
                                 [&name](const ParameterDescriptor& d) { return d.name == name; });
        if (desc == descriptors.end()) {
            error = fmt::format("unknown parameter '{}'", name);
            return false;
        }

        if (type_of(value) != desc->type) {
            error = fmt::format("parameter '{}' must be {} (got {})",
                                name, type_name(desc->type), type_name(type_of(value)));
            return false;
        }

        // Bounds share the value's alternative, so variant ordering compares the numbers
        const auto& bounds = desc->constraints;
        if (bounds.min_value && bounds.min_value->index() == value.index() && value < *bounds.min_value) {
            error = fmt::format("parameter '{}' value {} is below the minimum {}",
                                name, value_to_string(value), value_to_string(*bounds.min_value));
            return false;
        }
        if (bounds.max_value && bounds.max_value->index() == value.index() && value > *bounds.max_value) {
            error = fmt::format("parameter '{}' value {} is above the maximum {}",
                                name, value_to_string(value), value_to_string(*bounds.max_value));
            return false;
        }
    }
    return true;
}

} // namespace parameter_util
} // namespace clipstack
