#include "connection.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace qode {
namespace client {

namespace {

// Reserved notification asking the worker to exit
constexpr const char *kShutdownNotification = "shutdown";

// Time a worker gets to act on "shutdown" before it is sent SIGTERM
constexpr int kShutdownGraceMs = 500;

constexpr size_t kReadChunkSize = 64 * 1024;

bool make_address(const std::string &host, int port, sockaddr_in &addr, std::string &error) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid host address: " + host;
        return false;
    }
    return true;
}

// Descriptive text for socket errors
std::string describe_socket_error(int err) {
    switch (err) {
        case ECONNREFUSED:
            return "the connection was refused by the peer (or timed out).";
        case ECONNRESET:
        case EPIPE:
            return "the remote host closed the connection.";
        case EACCES:
        case EPERM:
            return "the socket operation failed because the application lacked the required privileges.";
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return "the local system ran out of resources (e.g., too many sockets).";
        case ETIMEDOUT:
            return "the socket operation timed out.";
        case ENETDOWN:
        case ENETUNREACH:
        case EHOSTUNREACH:
            return "an error occurred with the network.";
        default:
            return "an unidentified error occurred (" + std::string(strerror(err)) + ").";
    }
}

}  // namespace

const char *connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:
            return "DISCONNECTED";
        case ConnectionState::CONNECTING:
            return "CONNECTING";
        case ConnectionState::CONNECTED:
            return "CONNECTED";
        case ConnectionState::CLOSING:
            return "CLOSING";
        case ConnectionState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

void WorkerCommand::resolve(int port, std::string &program, std::vector<std::string> &argv) const {
    argv.clear();
    if (interpreter.empty()) {
        // A bare name would be looked up on PATH instead of the working directory
        program = script.find('/') == std::string::npos ? "./" + script : script;
    } else {
        program = interpreter;
        argv.push_back(script);
    }
    argv.push_back(std::to_string(port));
    argv.insert(argv.end(), args.begin(), args.end());
}

int pick_free_port(const std::string &host, std::string &error) {
    sockaddr_in addr;
    if (!make_address(host, 0, addr, error)) {
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = "Failed to create probe socket: " + std::string(strerror(errno));
        return -1;
    }

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "Failed to bind probe socket: " + std::string(strerror(errno));
        ::close(fd);
        return -1;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        error = "getsockname failed: " + std::string(strerror(errno));
        ::close(fd);
        return -1;
    }

    ::close(fd);
    return ntohs(addr.sin_port);
}

Connection::Connection(events::EventLoop &loop, ConnectionOptions options, logging::Logger log)
    : loop_(loop), options_(std::move(options)), log_(std::move(log)), retry_(options_.retry) {}

Connection::~Connection() {
    on_connected.disconnect_all();
    on_disconnected.disconnect_all();
    on_error.disconnect_all();
    on_message.disconnect_all();
    on_connect_attempt.disconnect_all();
    close();
}

void Connection::set_error(ErrorCode code, const std::string &message) {
    error_code_ = code;
    error_ = message;
}

bool Connection::start(process::WorkerProcess &process, const WorkerCommand &command) {
    if (state_ != ConnectionState::DISCONNECTED && state_ != ConnectionState::FAILED) {
        set_error(ErrorCode::SOCKET_ERROR,
                  std::string("Connection already ") + connection_state_to_string(state_));
        return false;
    }

    std::string error;
    int port = pick_free_port(options_.host, error);
    if (port < 0) {
        set_error(ErrorCode::SOCKET_ERROR, error);
        LOG_ERROR(log_, error);
        return false;
    }

    std::string program;
    std::vector<std::string> argv;
    command.resolve(port, program, argv);

    if (!process.spawn(program, argv)) {
        set_error(ErrorCode::SPAWN_ERROR, process.last_error());
        state_ = ConnectionState::FAILED;
        return false;
    }

    detach_process();
    process_ = &process;
    started_slot_ = process.on_started.connect([this]() { schedule_attempt(options_.start_delay_ms); });
    exited_slot_ = process.on_exited.connect([this](int code) { on_worker_exited(code); });

    port_ = port;
    retry_.reset();
    frame_buffer_.reset();
    write_queue_.clear();
    set_error(ErrorCode::OK, "");
    state_ = ConnectionState::CONNECTING;
    return true;
}

bool Connection::connect_to(int port, int delay_ms) {
    if (state_ != ConnectionState::DISCONNECTED && state_ != ConnectionState::FAILED) {
        set_error(ErrorCode::SOCKET_ERROR,
                  std::string("Connection already ") + connection_state_to_string(state_));
        return false;
    }

    port_ = port;
    retry_.reset();
    frame_buffer_.reset();
    write_queue_.clear();
    set_error(ErrorCode::OK, "");
    state_ = ConnectionState::CONNECTING;
    schedule_attempt(delay_ms);
    return true;
}

void Connection::schedule_attempt(int delay_ms) {
    if (state_ != ConnectionState::CONNECTING) {
        return;
    }
    if (connect_timer_ != 0) {
        loop_.cancel(connect_timer_);
    }
    connect_timer_ = loop_.call_later(delay_ms, [this]() {
        connect_timer_ = 0;
        attempt_connect();
    });
}

void Connection::attempt_connect() {
    if (state_ != ConnectionState::CONNECTING) {
        return;
    }

    int attempt = retry_.record_attempt();
    LOG_DEBUG(log_, "Connecting to " << options_.host << ":" << port_ << " (attempt " << attempt << "/"
                                     << retry_.max_attempts() << ")");
    on_connect_attempt.emit(attempt);
    if (state_ != ConnectionState::CONNECTING) {
        return;  // a subscriber closed us
    }

    sockaddr_in addr;
    std::string error;
    if (!make_address(options_.host, port_, addr, error)) {
        fail(ErrorCode::SOCKET_ERROR, error);
        return;
    }

    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        int err = errno;
        fd_ = -1;
        handle_connect_error(err);
        return;
    }

    int rc;
    do {
        rc = ::connect(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        handle_connected();
        return;
    }
    if (errno == EINPROGRESS) {
        loop_.watch(fd_, POLLOUT, [this](short revents) { on_connect_ready(revents); });
        return;
    }
    handle_connect_error(errno);
}

void Connection::on_connect_ready(short /*revents*/) {
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    loop_.unwatch(fd_);

    if (err == 0) {
        handle_connected();
    } else {
        handle_connect_error(err);
    }
}

void Connection::handle_connect_error(int err) {
    close_socket();

    if (err != ECONNREFUSED) {
        fail(ErrorCode::SOCKET_ERROR, "socket error: " + describe_socket_error(err));
        return;
    }

    // The worker may not have opened its listener yet
    LOG_DEBUG(log_, "socket error: " << describe_socket_error(err));
    set_error(ErrorCode::CONNECTION_REFUSED, "socket error: " + describe_socket_error(err));
    if (retry_.should_retry()) {
        schedule_attempt(retry_.next_delay_ms());
        return;
    }

    fail(ErrorCode::RETRY_EXHAUSTED, "Failed to connect to the worker after " +
                                         std::to_string(retry_.attempt_count()) + " unsuccessful attempts.");
}

void Connection::handle_connected() {
    int one = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    state_ = ConnectionState::CONNECTED;
    set_error(ErrorCode::OK, "");
    loop_.watch(fd_, POLLIN, [this](short revents) { on_socket_event(revents); });
    update_interest();

    LOG_DEBUG(log_, "connected to worker: " << options_.host << ":" << port_ << " (after "
                                            << retry_.attempt_count() << " attempt(s))");
    on_connected.emit();
}

void Connection::on_socket_event(short revents) {
    uint64_t session = session_;

    if ((revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        read_available();
        if (session != session_ || state_ != ConnectionState::CONNECTED) {
            return;
        }
    }

    if ((revents & POLLOUT) != 0) {
        flush_writes();
    }
}

void Connection::read_available() {
    uint64_t session = session_;
    char buf[kReadChunkSize];

    while (true) {
        ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
        if (r == 0) {
            drop("socket error: " + describe_socket_error(ECONNRESET));
            return;
        }
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            drop("socket error: " + describe_socket_error(errno));
            return;
        }

        auto frames = protocol::feed(frame_buffer_, buf, static_cast<size_t>(r));
        for (auto &frame : frames) {
            if (frame.error == protocol::FrameError::OVERSIZED) {
                drop(frame.error_message);
                return;
            }
            if (!frame.ok()) {
                LOG_ERROR(log_, frame.error_message);
                on_error.emit(ErrorCode::MALFORMED_MESSAGE, frame.error_message);
            } else {
                LOG_DEBUG(log_, "message received: " << frame.message->dump());
                on_message.emit(*frame.message);
            }
            // A subscriber may have closed (or restarted) the connection
            if (session != session_ || state_ != ConnectionState::CONNECTED) {
                return;
            }
        }
    }
}

bool Connection::send(const nlohmann::json &message) {
    if (state_ != ConnectionState::CONNECTED && state_ != ConnectionState::CLOSING) {
        set_error(ErrorCode::NOT_CONNECTED, "Not connected to the worker");
        return false;
    }
    if (fd_ < 0) {
        set_error(ErrorCode::NOT_CONNECTED, "Not connected to the worker");
        return false;
    }

    std::string frame;
    std::string error;
    if (!protocol::encode_frame(message, frame, error)) {
        set_error(ErrorCode::MALFORMED_MESSAGE, error);
        LOG_ERROR(log_, error);
        return false;
    }

    LOG_DEBUG(log_, "sending message: " << frame.substr(protocol::kHeaderSize));
    write_queue_.append(frame);

    if (state_ == ConnectionState::CLOSING) {
        return true;  // flushed synchronously by close()
    }
    return flush_writes();
}

bool Connection::flush_writes() {
    while (!write_queue_.empty()) {
        ssize_t n = ::send(fd_, write_queue_.data(), write_queue_.size(), MSG_NOSIGNAL);
        if (n > 0) {
            write_queue_.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        std::string reason = "socket error: " + describe_socket_error(n < 0 ? errno : EPIPE);
        drop(reason);
        return false;
    }

    update_interest();
    return true;
}

bool Connection::flush_blocking(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();

    while (!write_queue_.empty()) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (elapsed_ms >= timeout_ms) {
            LOG_WARN(log_, "Timeout flushing " << write_queue_.size() << " bytes to the worker");
            return false;
        }

        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int result = ::poll(&pfd, 1, static_cast<int>(timeout_ms - elapsed_ms));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (result == 0) {
            continue;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            return false;
        }

        ssize_t n = ::send(fd_, write_queue_.data(), write_queue_.size(), MSG_NOSIGNAL);
        if (n > 0) {
            write_queue_.erase(0, static_cast<size_t>(n));
        } else if (n < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            return false;
        }
    }
    return true;
}

void Connection::update_interest() {
    if (fd_ < 0 || state_ != ConnectionState::CONNECTED) {
        return;
    }
    short events = POLLIN;
    if (!write_queue_.empty()) {
        events |= POLLOUT;
    }
    loop_.update_events(fd_, events);
}

void Connection::drop(const std::string &reason) {
    LOG_ERROR(log_, reason);
    close_socket();
    frame_buffer_.reset();
    write_queue_.clear();
    state_ = ConnectionState::DISCONNECTED;
    set_error(ErrorCode::SOCKET_ERROR, reason);

    LOG_DEBUG(log_, "disconnected from worker: " << options_.host << ":" << port_);
    on_error.emit(ErrorCode::SOCKET_ERROR, reason);
    on_disconnected.emit();
}

void Connection::fail(ErrorCode code, const std::string &reason) {
    LOG_ERROR(log_, reason);
    close_socket();
    if (connect_timer_ != 0) {
        loop_.cancel(connect_timer_);
        connect_timer_ = 0;
    }
    state_ = is_fatal(code) ? ConnectionState::FAILED : ConnectionState::DISCONNECTED;
    set_error(code, reason);

    // Nothing will talk to this worker any more
    if (is_fatal(code) && process_ != nullptr) {
        process::WorkerProcess *process = process_;
        detach_process();
        if (process->is_running() && !process->terminate(options_.terminate_timeout_ms)) {
            process->kill();
        }
    }

    on_error.emit(code, reason);
}

void Connection::close_socket() {
    if (fd_ >= 0) {
        loop_.unwatch(fd_);
        ::close(fd_);
        fd_ = -1;
    }
    ++session_;
}

void Connection::on_worker_exited(int code) {
    if (state_ != ConnectionState::CONNECTING) {
        return;  // connected: the stream reports the hang-up itself
    }
    fail(ErrorCode::SPAWN_ERROR,
         "Worker exited with code " + std::to_string(code) + " before accepting a connection");
}

void Connection::detach_process() {
    if (process_ != nullptr) {
        process_->on_started.disconnect(started_slot_);
        process_->on_exited.disconnect(exited_slot_);
    }
    process_ = nullptr;
    started_slot_ = 0;
    exited_slot_ = 0;
}

void Connection::close() {
    if (connect_timer_ != 0) {
        loop_.cancel(connect_timer_);
        connect_timer_ = 0;
    }

    bool was_connected = state_ == ConnectionState::CONNECTED;
    bool shutdown_sent = false;
    state_ = ConnectionState::CLOSING;

    if (was_connected && fd_ >= 0) {
        if (process_ != nullptr && process_->is_running()) {
            // Ask the worker to exit; must reach the wire before the socket closes
            shutdown_sent = send(nlohmann::json(kShutdownNotification));
        }
        shutdown_sent = flush_blocking(options_.terminate_timeout_ms) && shutdown_sent;
    }
    close_socket();
    frame_buffer_.reset();
    write_queue_.clear();

    if (process_ != nullptr) {
        process::WorkerProcess *process = process_;
        detach_process();
        if (shutdown_sent) {
            process->wait_for_finished(std::min(kShutdownGraceMs, options_.terminate_timeout_ms));
        }
        if (process->is_running() && !process->terminate(options_.terminate_timeout_ms)) {
            process->kill();
        }
    }

    retry_.reset();
    state_ = ConnectionState::DISCONNECTED;

    if (was_connected) {
        LOG_DEBUG(log_, "disconnected from worker: " << options_.host << ":" << port_);
        on_disconnected.emit();
    }
}

}  // namespace client
}  // namespace qode
