#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "errors.hpp"
#include "events/event_loop.hpp"
#include "events/signal.hpp"
#include "logging/logger.hpp"
#include "process/worker_process.hpp"
#include "protocol/frame_codec.hpp"
#include "retry_policy.hpp"

namespace qode {
namespace client {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    CLOSING,
    FAILED  // spawn failure or retries exhausted; start() again to recover
};

const char *connection_state_to_string(ConnectionState state);

// How to launch the worker. The port is inserted right after the script.
struct WorkerCommand {
    std::string script;
    std::string interpreter;  // empty: script is a native executable
    std::vector<std::string> args;

    // "interpreter script <port> args..." or "script <port> args..."
    void resolve(int port, std::string &program, std::vector<std::string> &argv) const;
};

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    RetryPolicyConfig retry;         // 100 attempts, 100ms apart
    int start_delay_ms = 100;        // Worker start -> first connection attempt
    int terminate_timeout_ms = 5000; // Graceful worker shutdown before SIGKILL
};

// Ask the OS for a free port on host (bind to port 0, read it back, release).
// Returns -1 on failure (sets error).
int pick_free_port(const std::string &host, std::string &error);

// Connection owns the TCP stream to the worker and drives the
// connect/retry state machine. Inbound bytes are deframed and emitted as
// messages; outbound messages are framed and queued in send order.
class Connection {
public:
    Connection(events::EventLoop &loop, ConnectionOptions options, logging::Logger log);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Pick a port, spawn the worker on it and start connecting once the
    // worker reports started. process is referenced, not owned, and must
    // outlive the connection attempt.
    bool start(process::WorkerProcess &process, const WorkerCommand &command);

    // Connect to a peer that is (or will be) listening on port, without
    // spawning anything
    bool connect_to(int port, int delay_ms = 0);

    // Frame and queue a message. Fails with NOT_CONNECTED unless connected.
    bool send(const nlohmann::json &message);

    // Send "shutdown" if the worker runs, close the stream, terminate the
    // worker (escalating to kill after terminate_timeout_ms)
    void close();

    ConnectionState state() const { return state_; }
    bool is_connected() const { return state_ == ConnectionState::CONNECTED; }
    int port() const { return port_; }
    int attempt_count() const { return retry_.attempt_count(); }
    size_t pending_write_bytes() const { return write_queue_.size(); }

    ErrorCode last_error_code() const { return error_code_; }
    const std::string &last_error() const { return error_; }

    const ConnectionOptions &options() const { return options_; }

    events::Signal<> on_connected;
    events::Signal<> on_disconnected;
    events::Signal<ErrorCode, const std::string &> on_error;
    events::Signal<const nlohmann::json &> on_message;
    events::Signal<int> on_connect_attempt;

private:
    events::EventLoop &loop_;
    ConnectionOptions options_;
    logging::Logger log_;
    RetryPolicy retry_;

    ConnectionState state_ = ConnectionState::DISCONNECTED;
    int fd_ = -1;
    int port_ = -1;
    uint64_t session_ = 0;  // bumped whenever the socket is closed
    events::EventLoop::TimerId connect_timer_ = 0;

    protocol::FrameBuffer frame_buffer_;
    std::string write_queue_;

    ErrorCode error_code_ = ErrorCode::OK;
    std::string error_;

    process::WorkerProcess *process_ = nullptr;
    events::Signal<>::SlotId started_slot_ = 0;
    events::Signal<int>::SlotId exited_slot_ = 0;

    void set_error(ErrorCode code, const std::string &message);
    void schedule_attempt(int delay_ms);
    void attempt_connect();
    void on_connect_ready(short revents);
    void handle_connect_error(int err);
    void handle_connected();
    void on_socket_event(short revents);
    void read_available();
    bool flush_writes();
    bool flush_blocking(int timeout_ms);
    void update_interest();
    void drop(const std::string &reason);
    void fail(ErrorCode code, const std::string &reason);
    void close_socket();
    void detach_process();
    void on_worker_exited(int code);
};

}  // namespace client
}  // namespace qode
