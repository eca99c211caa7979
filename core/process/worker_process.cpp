#include "worker_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

namespace qode {
namespace process {

namespace {

// Interval between non-blocking waitpid() checks while the worker runs
constexpr int kReapIntervalMs = 50;

void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

const char *process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::NOT_STARTED:
            return "NOT_STARTED";
        case ProcessState::STARTING:
            return "STARTING";
        case ProcessState::RUNNING:
            return "RUNNING";
        case ProcessState::CRASHED:
            return "CRASHED";
        case ProcessState::EXITED:
            return "EXITED";
        default:
            return "UNKNOWN";
    }
}

const char *process_error_to_string(ProcessError error) {
    switch (error) {
        case ProcessError::FAILED_TO_START:
            return "FAILED_TO_START";
        case ProcessError::CRASHED:
            return "CRASHED";
        case ProcessError::TIMED_OUT:
            return "TIMED_OUT";
        case ProcessError::WRITE_ERROR:
            return "WRITE_ERROR";
        case ProcessError::READ_ERROR:
            return "READ_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

const char *describe_process_error(ProcessError error) {
    switch (error) {
        case ProcessError::FAILED_TO_START:
            return "the process failed to start. Either the invoked program is missing, or you may have "
                   "insufficient permissions to invoke the program.";
        case ProcessError::CRASHED:
            return "the process crashed some time after starting successfully.";
        case ProcessError::TIMED_OUT:
            return "the wait for the process timed out. The process state is unchanged.";
        case ProcessError::WRITE_ERROR:
            return "an error occurred when attempting to write to the process. For example, the process may "
                   "not be running, or it may have closed its input channel.";
        case ProcessError::READ_ERROR:
            return "an error occurred when attempting to read from the process. For example, the process may "
                   "not be running.";
        default:
            return "an unknown error occurred.";
    }
}

WorkerProcess::WorkerProcess(events::EventLoop &loop, logging::Logger client_log, logging::Logger server_log)
    : loop_(loop), client_log_(std::move(client_log)), server_log_(std::move(server_log)) {}

WorkerProcess::~WorkerProcess() {
    // Subscribers may already be gone; nobody is told about this exit.
    on_started.disconnect_all();
    on_error.disconnect_all();
    on_exited.disconnect_all();

    if (is_running()) {
        kill();
    }

    if (reap_timer_ != 0) {
        loop_.cancel(reap_timer_);
        reap_timer_ = 0;
    }
    close_output(Stream::STDOUT);
    close_output(Stream::STDERR);
}

bool WorkerProcess::spawn(const std::string &program, const std::vector<std::string> &args) {
    error_.clear();

    if (is_running()) {
        error_ = "Worker process already running (PID=" + std::to_string(pid_) + ")";
        return false;
    }
    if (program.empty()) {
        error_ = "Executable not specified";
        return false;
    }
    std::error_code ec;
    if (program.find('/') != std::string::npos && !std::filesystem::exists(program, ec)) {
        error_ = "Executable not found: " + program;
        LOG_ERROR(client_log_, error_);
        on_error.emit(ProcessError::FAILED_TO_START, describe_process_error(ProcessError::FAILED_TO_START));
        return false;
    }

    command_line_ = program;
    for (const auto &arg : args) {
        command_line_ += " " + arg;
    }
    LOG_DEBUG(client_log_, "starting worker process: " << command_line_);

    // Parent-side ends are close-on-exec; dup2() clears the flag on the
    // child's stdout/stderr.
    int stdout_pipe[2];
    int stderr_pipe[2];
    int status_pipe[2];

    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stderr pipe: " + std::string(strerror(errno));
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return false;
    }
    // Reports exec() failure to the parent; closed by a successful exec
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create status pipe: " + std::string(strerror(errno));
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        return false;
    }

    // Construct argv before fork: no allocation in the child
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());

        // If we get here, exec failed
        int exec_errno = errno;
        ssize_t ignored = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        error_ = "Failed to start '" + program + "': " + std::string(strerror(exec_errno));
        LOG_ERROR(client_log_, error_);
        on_error.emit(ProcessError::FAILED_TO_START, describe_process_error(ProcessError::FAILED_TO_START));
        return false;
    }

    pid_ = pid;
    stdout_read_fd_ = stdout_pipe[0];
    stderr_read_fd_ = stderr_pipe[0];
    fcntl(stdout_read_fd_, F_SETFL, fcntl(stdout_read_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(stderr_read_fd_, F_SETFL, fcntl(stderr_read_fd_, F_GETFL) | O_NONBLOCK);

    state_ = ProcessState::STARTING;
    exit_code_.reset();
    stop_requested_ = false;
    stdout_lines_ = LineSplitter();
    stderr_lines_ = LineSplitter();

    watch_output(Stream::STDOUT);
    watch_output(Stream::STDERR);
    schedule_reap();

    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive, pid]() {
        if (alive.expired() || pid_ != pid || state_ != ProcessState::STARTING) {
            return;
        }
        state_ = ProcessState::RUNNING;
        LOG_DEBUG(client_log_, "worker process started (PID=" << pid << ")");
        on_started.emit();
    });

    return true;
}

bool WorkerProcess::is_running() const {
    return state_ == ProcessState::STARTING || state_ == ProcessState::RUNNING;
}

bool WorkerProcess::terminate(int timeout_ms) {
    if (!is_running()) {
        return true;
    }

    LOG_DEBUG(client_log_, "terminating worker process (PID=" << pid_ << ")");
    stop_requested_ = true;
    if (::kill(pid_, SIGTERM) < 0 && errno != ESRCH) {
        error_ = "Failed to signal worker: " + std::string(strerror(errno));
        return false;
    }

    if (!wait_for_finished(timeout_ms)) {
        LOG_WARN(client_log_, "worker process did not exit within " << timeout_ms << "ms");
        on_error.emit(ProcessError::TIMED_OUT, describe_process_error(ProcessError::TIMED_OUT));
        return false;
    }
    return true;
}

void WorkerProcess::kill() {
    if (!is_running()) {
        return;
    }

    LOG_WARN(client_log_, "killing worker process (PID=" << pid_ << ")");
    stop_requested_ = true;
    ::kill(pid_, SIGKILL);
    wait_for_finished(500);
}

void WorkerProcess::watch_output(Stream stream) {
    int fd = stream == Stream::STDOUT ? stdout_read_fd_ : stderr_read_fd_;
    loop_.watch(fd, POLLIN, [this, stream](short) { read_output(stream); });
}

void WorkerProcess::read_output(Stream stream) {
    int &fd = stream == Stream::STDOUT ? stdout_read_fd_ : stderr_read_fd_;
    LineSplitter &splitter = stream == Stream::STDOUT ? stdout_lines_ : stderr_lines_;
    char buf[4096];

    while (fd >= 0) {
        ssize_t r = ::read(fd, buf, sizeof(buf));
        if (r > 0) {
            forward_lines(stream, splitter.push(buf, static_cast<size_t>(r)));
            continue;
        }
        if (r == 0) {
            // EOF: the last line may lack its newline
            forward_lines(stream, splitter.finish());
            close_output(stream);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }

        std::string message = "Read from worker failed: " + std::string(strerror(errno));
        LOG_ERROR(client_log_, message);
        close_output(stream);
        on_error.emit(ProcessError::READ_ERROR, message);
        return;
    }
}

void WorkerProcess::forward_lines(Stream stream, const std::vector<std::string> &lines) {
    for (const auto &line : lines) {
        if (stream == Stream::STDOUT) {
            LOG_INFO(server_log_, line);
        } else {
            LOG_ERROR(server_log_, line);
        }
    }
}

void WorkerProcess::close_output(Stream stream) {
    int &fd = stream == Stream::STDOUT ? stdout_read_fd_ : stderr_read_fd_;
    if (fd >= 0) {
        loop_.unwatch(fd);
        close_fd(fd);
    }
}

void WorkerProcess::schedule_reap() {
    reap_timer_ = loop_.call_later(kReapIntervalMs, [this]() {
        reap_timer_ = 0;
        if (!is_running()) {
            return;
        }
        if (!try_reap()) {
            schedule_reap();
        }
    });
}

bool WorkerProcess::try_reap() {
    if (pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        handle_exit(status);
        return true;
    }
    if (result < 0) {
        // ECHILD: reaped elsewhere; the exit status is lost
        LOG_WARN(client_log_, "waitpid failed for worker (PID=" << pid_ << "): " << strerror(errno));
        pid_ = -1;
        state_ = ProcessState::EXITED;
        exit_code_ = -1;
        on_error.emit(ProcessError::UNKNOWN_ERROR, describe_process_error(ProcessError::UNKNOWN_ERROR));
        on_exited.emit(-1);
        return true;
    }
    return false;
}

bool WorkerProcess::wait_for_finished(int timeout_ms) {
    if (!is_running()) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void WorkerProcess::handle_exit(int status) {
    pid_t pid = pid_;
    pid_ = -1;

    if (reap_timer_ != 0) {
        loop_.cancel(reap_timer_);
        reap_timer_ = 0;
    }

    // Forward whatever the worker wrote before exiting
    read_output(Stream::STDOUT);
    read_output(Stream::STDERR);
    forward_lines(Stream::STDOUT, stdout_lines_.finish());
    forward_lines(Stream::STDERR, stderr_lines_.finish());
    close_output(Stream::STDOUT);
    close_output(Stream::STDERR);

    int code = -1;
    bool crashed = false;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
        crashed = !stop_requested_;
    }

    exit_code_ = code;
    state_ = crashed ? ProcessState::CRASHED : ProcessState::EXITED;
    LOG_DEBUG(client_log_, "worker process (PID=" << pid << ") finished with exit code " << code);

    if (crashed) {
        LOG_ERROR(client_log_, "worker process error " << process_error_to_string(ProcessError::CRASHED) << ": "
                                                        << describe_process_error(ProcessError::CRASHED));
        on_error.emit(ProcessError::CRASHED, describe_process_error(ProcessError::CRASHED));
    }
    on_exited.emit(code);
}

}  // namespace process
}  // namespace qode
