#pragma once

#include <string>
#include <vector>

#include "client/connection.hpp"

namespace qode {
namespace runtime {

struct WorkerConfig {
    std::string script;              // Path to the worker script or executable
    std::string interpreter;         // e.g. "python3"; empty for native workers
    std::vector<std::string> args;   // Extra arguments after the port
};

struct ConnectionConfig {
    std::string host = "127.0.0.1";  // Loopback address the worker listens on
    int max_retry = 100;             // Connection attempts before giving up
    int retry_delay_ms = 100;        // Delay between attempts
    std::vector<int> backoff_ms;     // Optional per-attempt delays (overrides retry_delay_ms)
    int start_delay_ms = 100;        // Worker start -> first attempt
};

struct ProcessConfig {
    int terminate_timeout_ms = 5000;  // Graceful shutdown before SIGKILL (100-60000ms)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ClientConfig {
    WorkerConfig worker;
    ConnectionConfig connection;
    ProcessConfig process;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ClientConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ClientConfig &config, std::string &error);

// Connection options for the client
client::ConnectionOptions to_connection_options(const ClientConfig &config);

// Worker command line for the client
client::WorkerCommand to_worker_command(const ClientConfig &config);

}  // namespace runtime
}  // namespace qode
