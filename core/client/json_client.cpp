#include "json_client.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace qode {
namespace client {

JsonClient::JsonClient(events::EventLoop &loop, ConnectionOptions options, std::shared_ptr<logging::LogSink> sink)
    : client_log_(sink, logging::Channel::CLIENT),
      server_log_(sink, logging::Channel::SERVER),
      process_(loop, client_log_, server_log_),
      connection_(loop, std::move(options), client_log_),
      router_(client_log_),
      rng_(std::random_device{}()) {
    connection_.on_message.connect([this](const nlohmann::json &message) { router_.dispatch(message); });

    connection_.on_connected.connect([this]() { on_connected.emit(); });

    connection_.on_disconnected.connect([this]() {
        // Nothing will answer these any more
        router_.clear();
        on_disconnected.emit();
    });

    connection_.on_error.connect([this](ErrorCode code, const std::string &message) {
        set_error(code, message);
        on_error.emit(code, message);
    });

    process_.on_error.connect([this](process::ProcessError error, const std::string &message) {
        if (error == process::ProcessError::FAILED_TO_START) {
            // start() reports the same failure synchronously
            set_error(ErrorCode::SPAWN_ERROR, message);
            on_error.emit(ErrorCode::SPAWN_ERROR, message);
            return;
        }
        std::string text = std::string("worker process error ") + process::process_error_to_string(error) + ": " +
                           message;
        set_error(ErrorCode::PROCESS_ERROR, text);
        on_error.emit(ErrorCode::PROCESS_ERROR, text);
    });
}

JsonClient::~JsonClient() {
    on_connected.disconnect_all();
    on_disconnected.disconnect_all();
    on_error.disconnect_all();
    close();
}

void JsonClient::set_error(ErrorCode code, const std::string &message) {
    error_code_ = code;
    error_ = message;
}

bool JsonClient::start(const std::string &worker_script, const std::string &interpreter,
                       const std::vector<std::string> &args) {
    WorkerCommand command;
    command.script = worker_script;
    command.interpreter = interpreter;
    command.args = args;
    return start(command);
}

bool JsonClient::start(const WorkerCommand &command) {
    std::error_code ec;
    if (command.script.empty() || !std::filesystem::exists(command.script, ec)) {
        set_error(ErrorCode::INVALID_SCRIPT, "Worker script not found: " + command.script +
                                                 (ec ? " (" + ec.message() + ")" : std::string()));
        LOG_ERROR(client_log_, error_);
        return false;
    }

    // A worker left behind by a dropped connection is no use to the new one
    if (process_.is_running() && (connection_.state() == ConnectionState::DISCONNECTED ||
                                  connection_.state() == ConnectionState::FAILED)) {
        LOG_WARN(client_log_, "stopping stale worker (PID=" << process_.pid() << ")");
        if (!process_.terminate(connection_.options().terminate_timeout_ms)) {
            process_.kill();
        }
    }

    if (!connection_.start(process_, command)) {
        set_error(connection_.last_error_code(), connection_.last_error());
        return false;
    }

    LOG_DEBUG(client_log_, "worker started: " << process_.command_line());
    set_error(ErrorCode::OK, "");
    return true;
}

std::optional<std::string> JsonClient::send_request(const std::string &target, const nlohmann::json &args,
                                                    ResponseCallback on_complete) {
    if (!is_connected()) {
        set_error(ErrorCode::NOT_CONNECTED, "Cannot send request '" + target + "': not connected to the worker");
        return std::nullopt;
    }

    std::string request_id = generate_request_id();
    nlohmann::json request = {{"request_id", request_id}, {"worker", target}, {"data", args}};

    if (!connection_.send(request)) {
        set_error(connection_.last_error_code(), connection_.last_error());
        return std::nullopt;
    }

    // The response cannot arrive before the loop runs again
    if (on_complete) {
        router_.add(request_id, std::move(on_complete));
    }
    return request_id;
}

bool JsonClient::send_notification(const std::string &name) {
    if (!is_connected()) {
        set_error(ErrorCode::NOT_CONNECTED, "Cannot send '" + name + "': not connected to the worker");
        return false;
    }
    if (!connection_.send(nlohmann::json(name))) {
        set_error(connection_.last_error_code(), connection_.last_error());
        return false;
    }
    return true;
}

void JsonClient::close() {
    connection_.close();
    router_.clear();
}

std::string JsonClient::generate_request_id() {
    // RFC 4122 version 4 UUID
    uint64_t high = rng_();
    uint64_t low = rng_();
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF), static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48), static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buf;
}

}  // namespace client
}  // namespace qode
