#pragma once

#include <atomic>

namespace qode {
namespace runtime {

// Records SIGINT/SIGTERM so the event loop can close the worker gracefully
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace qode
