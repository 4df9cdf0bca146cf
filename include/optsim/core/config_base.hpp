// include/optsim/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "optsim/core/error.hpp"

namespace optsim {

/**
 * @brief Base class for all configuration types
 *
 * Subclasses provide JSON conversion and, where ranges matter, validate().
 * Loading always runs validate() so a loaded config is ready to use.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to a JSON file, creating parent directories
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from a JSON file
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, or the error of load_from_json
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Apply a JSON document, then validate
     *
     * Fields absent from the document keep their current values.
     */
    Result<void> load_from_json(const nlohmann::json& j);

    /**
     * @brief Range checks; the default accepts everything
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace optsim
