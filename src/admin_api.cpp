#include "admin_api.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace dispatch {

AdminApi::AdminApi(std::shared_ptr<DispatcherService> service)
    : service_(std::move(service)) {}

ApiResponse AdminApi::list_profiles() const {
    json result = json::array();
    for (const auto& profile : service_->profiles()) {
        result.push_back(ConfigLoader::profile_to_json(profile));
    }
    return {200, result.dump()};
}

ApiResponse AdminApi::put_profile(const std::string& body) {
    auto profile = ConfigLoader::parse_profile(body);
    if (!profile.has_value()) {
        Logger::warn(Logger::Component::Admin, profile.error());
        return error_response(400, profile.error());
    }

    auto applied = service_->set_profile(profile.value());
    if (!applied.has_value()) {
        Logger::warn(Logger::Component::Admin, applied.error().message);
        return error_response(400, applied.error());
    }

    return {200, ConfigLoader::profile_to_json(profile.value()).dump()};
}

ApiResponse AdminApi::delete_profile(const std::string& tenant, const std::string& id) {
    if (!service_->remove_profile(tenant, id)) {
        return error_response(404, DispatchError{
            ErrorCode::ProfileNotFound,
            fmt::format("no dispatcher profile {}", profile_key(tenant, id))});
    }
    return {200, json{{"removed", profile_key(tenant, id)}}.dump()};
}

ApiResponse AdminApi::route(const std::string& tenant, const std::string& id) const {
    auto instance = service_->get_instance(tenant, id);
    if (!instance.has_value()) {
        return error_response(404, instance.error());
    }

    auto& selector = instance.value();
    json candidates = json::array();
    size_t max_conns = selector->max_conns();
    for (size_t i = 0; i < max_conns; ++i) {
        candidates.push_back(selector->next_conn_id());
    }

    return {200, json{
        {"profile", profile_key(tenant, id)},
        {"strategy", strategy_name(selector->strategy())},
        {"candidates", candidates}
    }.dump()};
}

ApiResponse AdminApi::error_response(int status, const std::string& message) {
    return {status, json{{"error", message}}.dump()};
}

ApiResponse AdminApi::error_response(int status, const DispatchError& error) {
    return {status, json{
        {"error", error.message},
        {"code", error_code_to_string(error.code)}
    }.dump()};
}

} // namespace dispatch
