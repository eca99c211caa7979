#include "config.hpp"

#include <arpa/inet.h>
#include <yaml-cpp/yaml.h>

#include <exception>

#include "logging/logger.hpp"

namespace qode {
namespace runtime {

namespace {

bool is_ipv4_address(const std::string &host) {
    in_addr addr;
    return inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

}  // namespace

bool validate_config(const ClientConfig &config, std::string &error) {
    // Validate worker settings
    if (config.worker.script.empty()) {
        error = "worker.script must be specified";
        return false;
    }

    // Validate connection settings
    if (!is_ipv4_address(config.connection.host)) {
        error = "connection.host must be an IPv4 address: " + config.connection.host;
        return false;
    }
    if (config.connection.max_retry < 1) {
        error = "connection.max_retry must be >= 1";
        return false;
    }
    if (config.connection.retry_delay_ms < 0) {
        error = "connection.retry_delay_ms must be >= 0";
        return false;
    }
    for (size_t i = 0; i < config.connection.backoff_ms.size(); ++i) {
        if (config.connection.backoff_ms[i] < 0) {
            error = "connection.backoff_ms[" + std::to_string(i) + "] must be >= 0";
            return false;
        }
    }
    if (config.connection.start_delay_ms < 0) {
        error = "connection.start_delay_ms must be >= 0";
        return false;
    }

    // Validate process settings
    if (config.process.terminate_timeout_ms < 100 || config.process.terminate_timeout_ms > 60000) {
        error = "process.terminate_timeout_ms must be between 100 and 60000";
        return false;
    }

    // Validate logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ClientConfig &config, std::string &error) {
    // Config problems are reported before any sink is configured
    logging::Logger log(std::make_shared<logging::StderrSink>(), logging::Channel::CLIENT);

    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"worker", "connection", "process", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN(log, "[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load worker config
        if (yaml["worker"]) {
            const auto &worker = yaml["worker"];
            if (worker["script"]) {
                config.worker.script = worker["script"].as<std::string>();
            }
            if (worker["interpreter"]) {
                config.worker.interpreter = worker["interpreter"].IsNull() ? ""
                                                                           : worker["interpreter"].as<std::string>();
            }
            if (worker["args"]) {
                config.worker.args.clear();  // Ensure idempotent parsing
                for (const auto &arg : worker["args"]) {
                    config.worker.args.push_back(arg.as<std::string>());
                }
            }
        }

        // Load connection config
        if (yaml["connection"]) {
            const auto &connection = yaml["connection"];
            if (connection["host"]) {
                config.connection.host = connection["host"].as<std::string>();
            }
            if (connection["max_retry"]) {
                config.connection.max_retry = connection["max_retry"].as<int>();
            }
            if (connection["retry_delay_ms"]) {
                config.connection.retry_delay_ms = connection["retry_delay_ms"].as<int>();
            }
            if (connection["backoff_ms"]) {
                config.connection.backoff_ms.clear();
                for (const auto &delay : connection["backoff_ms"]) {
                    config.connection.backoff_ms.push_back(delay.as<int>());
                }
            }
            if (connection["start_delay_ms"]) {
                config.connection.start_delay_ms = connection["start_delay_ms"].as<int>();
            }
        }

        // Load process config
        if (yaml["process"]) {
            if (yaml["process"]["terminate_timeout_ms"]) {
                config.process.terminate_timeout_ms = yaml["process"]["terminate_timeout_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_DEBUG(log, "[Config] Worker: " << config.worker.interpreter
                                           << (config.worker.interpreter.empty() ? "" : " ") << config.worker.script);
        LOG_DEBUG(log, "[Config] Connection: " << config.connection.host << " (max_retry "
                                               << config.connection.max_retry << ", retry delay "
                                               << config.connection.retry_delay_ms << "ms)");
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

client::ConnectionOptions to_connection_options(const ClientConfig &config) {
    client::ConnectionOptions options;
    options.host = config.connection.host;
    options.retry.max_attempts = config.connection.max_retry;
    options.retry.delay_ms = config.connection.retry_delay_ms;
    options.retry.backoff_ms = config.connection.backoff_ms;
    options.start_delay_ms = config.connection.start_delay_ms;
    options.terminate_timeout_ms = config.process.terminate_timeout_ms;
    return options;
}

client::WorkerCommand to_worker_command(const ClientConfig &config) {
    client::WorkerCommand command;
    command.script = config.worker.script;
    command.interpreter = config.worker.interpreter;
    command.args = config.worker.args;
    return command;
}

}  // namespace runtime
}  // namespace qode
