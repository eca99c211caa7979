#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "connection.hpp"
#include "errors.hpp"
#include "events/event_loop.hpp"
#include "events/signal.hpp"
#include "logging/logger.hpp"
#include "process/worker_process.hpp"
#include "request_router.hpp"

namespace qode {
namespace client {

// JsonClient starts the analysis worker and exchanges JSON requests with it.
//
// All methods, and every callback, run on the thread driving the EventLoop.
// Precondition failures are reported synchronously through the return value
// and last_error_code(); transport and process failures arrive via on_error.
class JsonClient {
public:
    JsonClient(events::EventLoop &loop, ConnectionOptions options = ConnectionOptions(),
               std::shared_ptr<logging::LogSink> sink = nullptr);
    ~JsonClient();

    JsonClient(const JsonClient &) = delete;
    JsonClient &operator=(const JsonClient &) = delete;

    // Launch worker_script (through interpreter unless empty) on a free
    // local port and start connecting. Fails with INVALID_SCRIPT if the
    // script does not exist, SPAWN_ERROR if the process cannot start.
    bool start(const std::string &worker_script, const std::string &interpreter = "",
               const std::vector<std::string> &args = {});
    bool start(const WorkerCommand &command);

    // Ask the worker to run target with args. on_complete (optional) is
    // invoked once with the response. Returns the request id, or nullopt
    // (NOT_CONNECTED) when there is no connection to a running worker.
    std::optional<std::string> send_request(const std::string &target, const nlohmann::json &args,
                                            ResponseCallback on_complete = nullptr);

    // Fire-and-forget message (a bare JSON string), e.g. "shutdown"
    bool send_notification(const std::string &name);

    // Shut the worker down and drop pending requests without invoking them
    void close();

    bool is_connected() const { return connection_.is_connected() && process_.is_running(); }
    bool is_worker_running() const { return process_.is_running(); }
    ConnectionState state() const { return connection_.state(); }
    size_t pending_requests() const { return router_.pending_count(); }

    ErrorCode last_error_code() const { return error_code_; }
    const std::string &last_error() const { return error_; }

    Connection &connection() { return connection_; }
    process::WorkerProcess &worker() { return process_; }

    events::Signal<> on_connected;
    events::Signal<> on_disconnected;
    events::Signal<ErrorCode, const std::string &> on_error;

private:
    logging::Logger client_log_;
    logging::Logger server_log_;
    process::WorkerProcess process_;
    Connection connection_;
    RequestRouter router_;
    std::mt19937_64 rng_;

    ErrorCode error_code_ = ErrorCode::OK;
    std::string error_;

    void set_error(ErrorCode code, const std::string &message);
    std::string generate_request_id();
};

}  // namespace client
}  // namespace qode
