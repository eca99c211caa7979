// qode-request
// Starts the configured worker, sends one request and prints the results

#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "client/json_client.hpp"
#include "events/event_loop.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: qode-request [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH      Path to config file (default: qode.yaml)\n";
    std::cerr << "  --target=NAME      Worker to run (required)\n";
    std::cerr << "  --data=JSON        Request arguments (default: {})\n";
    std::cerr << "  --timeout-ms=N     Give up after N milliseconds (default: 30000)\n";
    std::cerr << "  --help, -h         Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "qode.yaml";  // Default
    std::string target;
    std::string data_text = "{}";
    int timeout_ms = 30000;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg.substr(0, 9) == "--target=") {
            target = arg.substr(9);
        } else if (arg.substr(0, 7) == "--data=") {
            data_text = arg.substr(7);
        } else if (arg.substr(0, 13) == "--timeout-ms=") {
            try {
                timeout_ms = std::stoi(arg.substr(13));
            } catch (const std::exception &) {
                std::cerr << "Invalid --timeout-ms value: " << arg.substr(13) << "\n";
                return 1;
            }
            if (timeout_ms <= 0) {
                std::cerr << "--timeout-ms must be positive\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (target.empty()) {
        std::cerr << "ERROR: --target is required\n";
        print_usage();
        return 1;
    }

    nlohmann::json data = nlohmann::json::parse(data_text, nullptr, false);
    if (data.is_discarded()) {
        std::cerr << "ERROR: --data is not valid JSON: " << data_text << "\n";
        return 1;
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as the sink is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    qode::runtime::ClientConfig config;
    std::string error;
    if (!qode::runtime::load_config(config_path, config, error)) {
        std::cerr << "ERROR: Failed to load config: " << error << "\n";
        return 1;
    }

    auto sink = std::make_shared<qode::logging::StderrSink>(qode::logging::string_to_level(config.logging.level));
    qode::logging::Logger log(sink, qode::logging::Channel::CLIENT);

    qode::events::EventLoop loop;
    qode::client::JsonClient client(loop, qode::runtime::to_connection_options(config), sink);

    bool done = false;
    bool succeeded = false;

    client.on_connected.connect([&]() {
        LOG_INFO(log, "Connected to worker on port " << client.connection().port());
        auto request_id = client.send_request(target, data, [&](bool status, const nlohmann::json &results) {
            std::cout << results.dump(2) << std::endl;
            succeeded = status;
            done = true;
        });
        if (!request_id) {
            LOG_ERROR(log, "Failed to send request: " << client.last_error());
            done = true;
        } else {
            LOG_DEBUG(log, "Sent request " << *request_id << " to '" << target << "'");
        }
    });

    client.on_error.connect([&](qode::client::ErrorCode code, const std::string &message) {
        if (qode::client::is_fatal(code)) {
            LOG_ERROR(log, qode::client::error_code_to_string(code) << ": " << message);
            done = true;
        }
    });

    client.on_disconnected.connect([&]() {
        if (!done) {
            LOG_ERROR(log, "Worker disconnected before responding");
            done = true;
        }
    });

    // Install signal handler for graceful shutdown
    qode::runtime::SignalHandler::install();

    if (!client.start(qode::runtime::to_worker_command(config))) {
        LOG_ERROR(log, "Failed to start worker: " << client.last_error());
        return 1;
    }

    bool finished = loop.run_until(
        [&]() {
            if (qode::runtime::SignalHandler::is_shutdown_requested()) {
                LOG_INFO(log, "Signal received, closing client...");
                return true;
            }
            return done;
        },
        timeout_ms);

    if (!finished) {
        LOG_ERROR(log, "Timed out after " << timeout_ms << "ms");
    }

    client.close();
    LOG_DEBUG(log, "Shutdown complete");
    return succeeded ? 0 : 1;
}
