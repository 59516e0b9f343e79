#include "config_loader.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>


using json = nlohmann::json;

namespace dispatch {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        if (!j.contains("dispatcher")) {
            return std::unexpected("Missing 'dispatcher' section");
        }
        auto& d = j["dispatcher"];
        int port = d.value("port", 2080);
        if (port < 1 || port > 65535) {
            return std::unexpected(fmt::format("Invalid 'port' {}: must be in 1..65535", port));
        }
        config.dispatcher.port = static_cast<uint16_t>(port);
        config.dispatcher.log_file = d.value("log_file", "logs/dispatcher.log");
        config.dispatcher.log_level = d.value("log_level", "INFO");

        if (!j.contains("profiles")) {
            return std::unexpected("Missing 'profiles' section");
        }
        if (!j["profiles"].is_array()) {
            return std::unexpected("'profiles' must be an array");
        }
        for (const auto& p : j["profiles"]) {
            auto profile = profile_from_json(p);
            if (!profile.has_value()) {
                return std::unexpected(profile.error());
            }
            config.profiles.push_back(std::move(profile.value()));
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<DispatchProfile, std::string> ConfigLoader::parse_profile(const std::string& content) {
    try {
        return profile_from_json(json::parse(content));
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<DispatchProfile, std::string> ConfigLoader::profile_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return std::unexpected("Profile must be a JSON object");
        }

        DispatchProfile profile;
        profile.tenant = j.value("tenant", "default");
        profile.id = j.value("id", "");
        profile.strategy = j.value("strategy", kMetaWeight);
        profile.weight = j.value("weight", 0.0);

        if (!j.contains("connections")) {
            return std::unexpected(fmt::format("Profile '{}' is missing 'connections'", profile.id));
        }
        if (!j["connections"].is_array()) {
            return std::unexpected(fmt::format("Profile '{}': 'connections' must be an array", profile.id));
        }
        for (const auto& conn : j["connections"]) {
            profile.connections.add(conn.value("id", ""), conn.value("weight", 0.0));
        }

        auto valid = validate_profile(profile);
        if (!valid.has_value()) {
            return std::unexpected(valid.error());
        }
        return profile;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid profile: ") + e.what());
    }
}

json ConfigLoader::profile_to_json(const DispatchProfile& profile) {
    json conns = json::array();
    for (const auto& conn : profile.connections) {
        conns.push_back(json{{"id", conn.id}, {"weight", conn.weight}});
    }
    return {
        {"tenant", profile.tenant},
        {"id", profile.id},
        {"strategy", profile.strategy},
        {"weight", profile.weight},
        {"connections", conns}
    };
}

std::expected<void, std::string> ConfigLoader::validate_profile(const DispatchProfile& profile) {
    if (profile.id.empty()) {
        return std::unexpected("Profile id must not be empty");
    }

    if (profile.connections.empty()) {
        return std::unexpected(fmt::format("Profile '{}' has no connections", profile.id));
    }

    for (const auto& conn : profile.connections) {
        if (conn.id.empty()) {
            return std::unexpected(fmt::format("Profile '{}' has a connection without id", profile.id));
        }
    }

    return {};
}

} // namespace dispatch
