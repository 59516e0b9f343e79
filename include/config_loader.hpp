#pragma once

#include "dispatch_profile.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace dispatch {

struct DispatcherConfig {
    uint16_t port;
    std::string log_file;
    std::string log_level;
};

struct Config {
    DispatcherConfig dispatcher;
    std::vector<DispatchProfile> profiles;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

    // Single profile, as accepted by the admin API
    static std::expected<DispatchProfile, std::string> parse_profile(const std::string& content);

    static std::expected<DispatchProfile, std::string> profile_from_json(const nlohmann::json& j);
    static nlohmann::json profile_to_json(const DispatchProfile& profile);

private:
    static std::expected<void, std::string> validate_profile(const DispatchProfile& profile);
};

} // namespace dispatch
