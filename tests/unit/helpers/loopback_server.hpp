#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "protocol/frame_codec.hpp"

namespace qode::tests {

// Blocking TCP peer on 127.0.0.1 standing in for the worker's listener.
// Connection handshakes complete in the kernel backlog, so a client driven
// by the test's EventLoop connects before accept_client() is called.
class LoopbackServer {
public:
    LoopbackServer() = default;
    ~LoopbackServer();

    LoopbackServer(const LoopbackServer &) = delete;
    LoopbackServer &operator=(const LoopbackServer &) = delete;

    // Bind to an ephemeral port and listen
    bool listen(std::string &error);

    int port() const { return port_; }

    // Accept the pending client; false if none arrives within timeout_ms
    bool accept_client(int timeout_ms);

    // Write raw bytes to the accepted client
    bool send_raw(const std::string &bytes);

    // Frame and write a message
    bool send_message(const nlohmann::json &message);

    // Read until at least count messages arrived or timeout_ms elapsed
    std::vector<nlohmann::json> read_messages(size_t count, int timeout_ms);

    // Hang up on the client (listener stays open)
    void close_client();

    // Stop listening; later connection attempts are refused
    void close_listener();

private:
    int listen_fd_ = -1;
    int client_fd_ = -1;
    int port_ = -1;
    protocol::FrameBuffer buffer_;
};

}  // namespace qode::tests
