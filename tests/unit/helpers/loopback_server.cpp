#include "helpers/loopback_server.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

namespace qode::tests {

LoopbackServer::~LoopbackServer() {
    close_client();
    close_listener();
}

bool LoopbackServer::listen(std::string &error) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        error = "socket: " + std::string(strerror(errno));
        return false;
    }

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "bind: " + std::string(strerror(errno));
        return false;
    }
    if (::listen(listen_fd_, 4) < 0) {
        error = "listen: " + std::string(strerror(errno));
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        error = "getsockname: " + std::string(strerror(errno));
        return false;
    }
    port_ = ntohs(addr.sin_port);
    return true;
}

bool LoopbackServer::accept_client(int timeout_ms) {
    pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (::poll(&pfd, 1, timeout_ms) <= 0) {
        return false;
    }
    client_fd_ = ::accept(listen_fd_, nullptr, nullptr);
    return client_fd_ >= 0;
}

bool LoopbackServer::send_raw(const std::string &bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(client_fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool LoopbackServer::send_message(const nlohmann::json &message) {
    std::string frame;
    std::string error;
    if (!protocol::encode_frame(message, frame, error)) {
        return false;
    }
    return send_raw(frame);
}

std::vector<nlohmann::json> LoopbackServer::read_messages(size_t count, int timeout_ms) {
    std::vector<nlohmann::json> messages;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (messages.size() < count) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                .count();
        if (remaining <= 0) {
            break;
        }

        pollfd pfd;
        pfd.fd = client_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, static_cast<int>(remaining)) <= 0) {
            continue;
        }

        char buf[4096];
        ssize_t r = ::recv(client_fd_, buf, sizeof(buf), 0);
        if (r <= 0) {
            break;
        }
        for (auto &frame : protocol::feed(buffer_, buf, static_cast<size_t>(r))) {
            if (frame.ok()) {
                messages.push_back(*frame.message);
            }
        }
    }
    return messages;
}

void LoopbackServer::close_client() {
    if (client_fd_ >= 0) {
        ::close(client_fd_);
        client_fd_ = -1;
    }
}

void LoopbackServer::close_listener() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

}  // namespace qode::tests
