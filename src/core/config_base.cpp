// src/core/config_base.cpp

#include "optsim/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace optsim {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << to_json() << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Error saving config to " + filepath + ": " + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Malformed JSON in " + filepath + ": " + e.what(), "ConfigBase");
    }
    return load_from_json(j);
}

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    try {
        from_json(j);
    } catch (const OptsimError& e) {
        // Field parsers report bad values (e.g. dates) through Result::value()
        return make_error<void>(e.code(), std::string("Invalid config value: ") + e.what(),
                                "ConfigBase");
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Unexpected config field type: ") + e.what(),
                                "ConfigBase");
    }
    return validate();
}

}  // namespace optsim
