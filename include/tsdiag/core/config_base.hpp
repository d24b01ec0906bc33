// include/tsdiag/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "tsdiag/core/error.hpp"

namespace tsdiag {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from
     * @throws DiagError when a value is present but not recognized
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace tsdiag
