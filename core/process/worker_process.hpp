#pragma once

#include <sys/types.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "events/event_loop.hpp"
#include "events/signal.hpp"
#include "line_splitter.hpp"
#include "logging/logger.hpp"

namespace qode {
namespace process {

enum class ProcessState {
    NOT_STARTED,
    STARTING,  // exec succeeded, on_started not delivered yet
    RUNNING,
    CRASHED,
    EXITED
};

// Mirrors the OS-level process error categories
enum class ProcessError {
    FAILED_TO_START,
    CRASHED,
    TIMED_OUT,
    WRITE_ERROR,
    READ_ERROR,
    UNKNOWN_ERROR
};

const char *process_state_to_string(ProcessState state);
const char *process_error_to_string(ProcessError error);

// Human-readable explanation of a process error
const char *describe_process_error(ProcessError error);

// WorkerProcess manages the lifecycle of the analysis worker
// Responsibilities:
// - Spawn the worker with captured stdout/stderr
// - Forward worker output line by line to the server log channel
// - Detect exit and crashes
// - Graceful (SIGTERM) and forced (SIGKILL) termination
class WorkerProcess {
public:
    WorkerProcess(events::EventLoop &loop, logging::Logger client_log, logging::Logger server_log);
    ~WorkerProcess();

    // Delete copy/move (owns the child and its pipes)
    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Start program with args. program is resolved on PATH unless it
    // contains a '/', in which case it must exist.
    // Returns true on success, false on failure (sets error_). A program
    // that cannot be executed also emits FAILED_TO_START.
    bool spawn(const std::string &program, const std::vector<std::string> &args);

    // True between a successful spawn and the observed exit
    bool is_running() const;

    // Request graceful termination and block up to timeout_ms for the exit.
    // Returns true if the process is gone, otherwise emits TIMED_OUT.
    // Escalating to kill() is up to the caller.
    bool terminate(int timeout_ms);

    // Forced termination (SIGKILL), reaps the child
    void kill();

    // Block up to timeout_ms for the worker to exit on its own.
    // Returns true if it is gone.
    bool wait_for_finished(int timeout_ms);

    ProcessState state() const { return state_; }
    std::optional<int> exit_code() const { return exit_code_; }
    pid_t pid() const { return pid_; }

    // "program arg1 arg2 ..." of the last spawn
    const std::string &command_line() const { return command_line_; }

    const std::string &last_error() const { return error_; }

    events::Signal<> on_started;
    events::Signal<ProcessError, const std::string &> on_error;
    events::Signal<int> on_exited;

private:
    enum class Stream { STDOUT, STDERR };

    events::EventLoop &loop_;
    logging::Logger client_log_;
    logging::Logger server_log_;
    std::string error_;
    std::string command_line_;

    ProcessState state_ = ProcessState::NOT_STARTED;
    std::optional<int> exit_code_;
    pid_t pid_ = -1;
    int stdout_read_fd_ = -1;
    int stderr_read_fd_ = -1;
    LineSplitter stdout_lines_;
    LineSplitter stderr_lines_;
    events::EventLoop::TimerId reap_timer_ = 0;
    bool stop_requested_ = false;

    // Lets posted callbacks detect that this object is gone
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void watch_output(Stream stream);
    void read_output(Stream stream);
    void forward_lines(Stream stream, const std::vector<std::string> &lines);
    void close_output(Stream stream);
    void schedule_reap();
    bool try_reap();
    void handle_exit(int status);
};

}  // namespace process
}  // namespace qode
