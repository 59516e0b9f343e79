#pragma once

#include "dispatcher_service.hpp"
#include <memory>
#include <string>

namespace dispatch {

struct ApiResponse {
    int status;
    std::string body;
};

// Admin operations over a DispatcherService, independent of the HTTP layer.
// Bodies are JSON.
class AdminApi {
public:
    explicit AdminApi(std::shared_ptr<DispatcherService> service);

    ApiResponse list_profiles() const;
    ApiResponse put_profile(const std::string& body);
    ApiResponse delete_profile(const std::string& tenant, const std::string& id);

    // Candidate connections of one request instance, in try order
    ApiResponse route(const std::string& tenant, const std::string& id) const;

private:
    static ApiResponse error_response(int status, const std::string& message);
    static ApiResponse error_response(int status, const DispatchError& error);

    std::shared_ptr<DispatcherService> service_;
};

} // namespace dispatch
