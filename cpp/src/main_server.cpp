#include "psrisk/api.hpp"
#include "psrisk/config.hpp"
#include "psrisk/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --config <path> [--dataset <path>] [--port <port>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string dataset_path;
    int port_override = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--dataset" || arg == "--port") && i + 1 >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--dataset") {
            dataset_path = argv[++i];
        } else if (arg == "--port") {
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                print_usage(argv[0]);
                return 1;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = std::make_shared<psrisk::EngineSettings>(psrisk::EngineSettings::from_toml(config_path));
        if (!dataset_path.empty()) {
            settings->dataset_path = dataset_path;
        }
        if (port_override >= 0) {
            settings->server.port = port_override;
        }
        settings->server.enabled = true;

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto runtime = psrisk::build_engine(settings);
        auto logger = psrisk::get_logger("psriskd");
        logger.info("psriskd_ready", {{"port", std::to_string(runtime.server->port())}});

        while (!g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        runtime.server->stop();
        logger.info("psriskd_shutdown");
    } catch (const std::exception& exc) {
        std::cerr << "psriskd error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
