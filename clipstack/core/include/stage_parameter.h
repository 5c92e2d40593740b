// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025

#pragma once

#include <string>
#include <variant>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace clipstack {

/// Parameter value types supported by stages
using ParameterValue = std::variant<
    int32_t,      // Integer values
    uint32_t,     // Unsigned integer values
    double,       // Floating point values
    bool,         // Boolean flags
    std::string   // String values
>;

/// Type of parameter
enum class ParameterType {
    INT32,
    UINT32,
    DOUBLE,
    BOOL,
    STRING
};

/// Inclusive bounds for numeric parameters (same alternative as the value)
struct ParameterConstraints {
    std::optional<ParameterValue> min_value;
    std::optional<ParameterValue> max_value;
};

/// Description of a stage parameter
struct ParameterDescriptor {
    std::string name;                 // Parameter internal name (e.g., "preset")
    std::string display_name;         // Human-readable name (e.g., "Weight Preset")
    std::string description;          // Detailed description of what parameter does
    ParameterType type;               // Parameter value type
    ParameterConstraints constraints; // Value constraints and defaults
};

/// Interface for stages that expose configurable parameters
class ParameterizedStage {
public:
    virtual ~ParameterizedStage() = default;

    /// Get list of parameters this stage supports
    virtual std::vector<ParameterDescriptor> get_parameter_descriptors() const = 0;

    /// Get current parameter values
    virtual std::map<std::string, ParameterValue> get_parameters() const = 0;

    /// Set parameter values
    /// Returns true if all parameters were valid and set successfully
    virtual bool set_parameters(const std::map<std::string, ParameterValue>& params) = 0;
};

/// Helper functions to work with parameter values
namespace parameter_util {
    /// Convert ParameterValue to string for display
    std::string value_to_string(const ParameterValue& value);

    /// Convert string to ParameterValue based on type (whole string must parse)
    std::optional<ParameterValue> string_to_value(const std::string& str, ParameterType type);

    /// Type held by a value
    ParameterType type_of(const ParameterValue& value);

    /// Get type name as string
    const char* type_name(ParameterType type);

    /// Parse a type name produced by type_name()
    std::optional<ParameterType> type_from_name(const std::string& name);

    /**
     * @brief Check values against a stage's descriptors
     *
     * Every name must be described, every value must have the described
     * type and lie within its bounds.
     *
     * @param error Set to a description of the first problem found
     * @return true if every value is acceptable
     */
    bool validate(const std::vector<ParameterDescriptor>& descriptors,
                  const std::map<std::string, ParameterValue>& params,
                  std::string& error);
}

} // namespace clipstack
