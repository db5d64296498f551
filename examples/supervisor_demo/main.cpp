/// Supervisor demo: loads a server configuration file, starts every server
/// and prints status events until interrupted.
/// Usage: ./supervisor_demo <servers.json> [server_id method [params_json]]
/// Example: ./supervisor_demo servers.json echo search '{"q":"a"}'
/// Set SPDLOG_LEVEL=debug for more detail.

#include <mcphost/mcphost.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_interrupted{false};
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <servers.json> [server_id method [params_json]]\n";
        return 1;
    }

    mcphost::logging::init();

    mcphost::HostConfig config;
    try {
        config = mcphost::load_config_file(argv[1]);
    } catch (const mcphost::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    mcphost::ServerRegistry registry{config.options};
    registry.subscribe([](const mcphost::StatusEvent& ev) {
        nlohmann::json j;
        mcphost::to_json(j, ev);
        std::cout << "[status] " << j.dump() << "\n";
    });
    registry.on_message([](const mcphost::ServerMessage& m) {
        nlohmann::json j = m.message;
        std::cout << "[" << m.server_id << "] " << j.dump() << "\n";
    });

    registry.initialize(config.servers);
    registry.start_all();

    int rc = 0;
    if (argc >= 4) {
        std::string id = argv[2];
        std::string method = argv[3];
        nlohmann::json params = nlohmann::json::object();
        if (argc >= 5) params = nlohmann::json::parse(argv[4], nullptr, false);
        if (params.is_discarded()) {
            std::cerr << "Error: params must be valid JSON\n";
            return 1;
        }

        if (!registry.wait_until_ready(id, std::chrono::seconds(30))) {
            std::cerr << "Server " << id << " did not become ready\n";
            rc = 1;
        } else {
            try {
                auto result = registry.call_method(id, method, params).get();
                std::cout << result.dump(2) << "\n";
            } catch (const mcphost::RpcError& e) {
                std::cerr << "Error " << e.code << ": " << e.what() << "\n";
                rc = 1;
            } catch (const mcphost::HostError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                rc = 1;
            }
        }
    } else {
        std::signal(SIGINT, [](int) { g_interrupted = true; });
        std::signal(SIGTERM, [](int) { g_interrupted = true; });
        std::cout << "Supervising " << config.servers.size() << " server(s). Ctrl-C to stop.\n";
        while (!g_interrupted) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        for (const auto& [id, snap] : registry.get_all_statuses()) {
            nlohmann::json j;
            mcphost::to_json(j, snap);
            std::cout << j.dump() << "\n";
        }
    }

    registry.dispose();
    return rc;
}
