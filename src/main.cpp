#include "admin_api.hpp"
#include "config_loader.hpp"
#include "dispatcher_service.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <spdlog/fmt/fmt.h>
#include <iostream>

using namespace dispatch;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

namespace {

void write_response(httplib::Response& res, const ApiResponse& api_res) {
    res.status = api_res.status;
    res.set_content(api_res.body, "application/json");
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.dispatcher.log_file, config.dispatcher.log_level);

    auto service = std::make_shared<DispatcherService>();
    for (const auto& profile : config.profiles) {
        auto installed = service->set_profile(profile);
        if (!installed.has_value()) {
            Logger::error(Logger::Component::Config,
                fmt::format("Rejected profile {}: {}", profile.key(), installed.error().message));
            Logger::shutdown();
            return 1;
        }
    }
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} dispatcher profiles", service->profile_count()));

    AdminApi api(service);
    httplib::Server server;

    server.set_read_timeout(5, 0);
    server.set_write_timeout(5, 0);

    server.Get("/profiles", [&](const httplib::Request&, httplib::Response& res) {
        write_response(res, api.list_profiles());
    });

    server.Put("/profiles", [&](const httplib::Request& req, httplib::Response& res) {
        write_response(res, api.put_profile(req.body));
    });

    server.Delete(R"(/profiles/([^/]+)/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        write_response(res, api.delete_profile(req.matches[1].str(), req.matches[2].str()));
    });

    server.Get(R"(/route/([^/]+)/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        write_response(res, api.route(req.matches[1].str(), req.matches[2].str()));
    });

    Logger::info(Logger::Component::Admin,
        fmt::format("Started on port {}", config.dispatcher.port));
    std::cout << fmt::format("Dispatcher admin started on port {}\n", config.dispatcher.port);
    std::cout << "Press Ctrl+C to stop\n";

    std::thread server_thread([&]() {
        server.listen("0.0.0.0", config.dispatcher.port);
    });

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Admin, "Shutting down gracefully");

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
