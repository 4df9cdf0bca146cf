// include/optsim/data/database_config.hpp
#pragma once

#include <cstdlib>
#include <string>
#include "optsim/core/config_base.hpp"

namespace optsim {

/**
 * @brief PostgreSQL connection settings
 *
 * The password may be left out of the file and supplied through the
 * OPTSIM_DB_PASSWORD environment variable.
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    std::string port{"5432"};
    std::string name{"optsim"};
    std::string username{"postgres"};
    std::string password;

    std::string connection_string() const {
        std::string pass = password;
        if (pass.empty()) {
            if (const char* env = std::getenv("OPTSIM_DB_PASSWORD")) {
                pass = env;
            }
        }
        std::string auth = pass.empty() ? username : username + ":" + pass;
        return "postgresql://" + auth + "@" + host + ":" + port + "/" + name;
    }

    Result<void> validate() const override {
        if (host.empty() || name.empty() || username.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Database host, name and username are required",
                                    "DatabaseConfig");
        }
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Database port must be numeric, got '" + port + "'",
                                    "DatabaseConfig");
        }
        return Result<void>();
    }

    nlohmann::json to_json() const override {
        // Password is never written back to disk
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["name"] = name;
        j["username"] = username;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port")) {
            // Accept both "5432" and 5432
            port = j.at("port").is_string() ? j.at("port").get<std::string>()
                                            : std::to_string(j.at("port").get<int>());
        }
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
        if (j.contains("username"))
            username = j.at("username").get<std::string>();
        if (j.contains("password"))
            password = j.at("password").get<std::string>();
    }
};

}  // namespace optsim
