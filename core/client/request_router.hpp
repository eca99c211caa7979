#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "logging/logger.hpp"

namespace qode {
namespace client {

// Called once with the worker's (status, results) for a request
using ResponseCallback = std::function<void(bool status, const nlohmann::json &results)>;

// RequestRouter - matches worker responses to the callbacks of pending requests
//
// A response is an object carrying "request_id" (string), "status" (bool)
// and "results". Anything else, and responses for unknown ids, are
// unsolicited messages and ignored.
class RequestRouter {
public:
    explicit RequestRouter(logging::Logger log = logging::Logger()) : log_(std::move(log)) {}

    // Register the callback for request_id (replaces an existing one)
    void add(const std::string &request_id, ResponseCallback callback);

    // Route an inbound message. The callback is removed before it runs, so
    // it can never fire twice. Returns true if a callback ran.
    bool dispatch(const nlohmann::json &message);

    bool is_pending(const std::string &request_id) const { return pending_.count(request_id) != 0; }
    size_t pending_count() const { return pending_.size(); }

    // Abandon every pending request without invoking its callback
    void clear();

private:
    logging::Logger log_;
    std::unordered_map<std::string, ResponseCallback> pending_;
};

}  // namespace client
}  // namespace qode
