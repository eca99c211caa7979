#include "request_router.hpp"

#include <exception>

namespace qode {
namespace client {

void RequestRouter::add(const std::string &request_id, ResponseCallback callback) {
    pending_[request_id] = std::move(callback);
}

bool RequestRouter::dispatch(const nlohmann::json &message) {
    if (!message.is_object()) {
        return false;  // notification or other internal message
    }

    auto id_it = message.find("request_id");
    auto status_it = message.find("status");
    auto results_it = message.find("results");
    if (id_it == message.end() || status_it == message.end() || results_it == message.end() ||
        !id_it->is_string() || !status_it->is_boolean()) {
        return false;
    }

    auto pending_it = pending_.find(id_it->get<std::string>());
    if (pending_it == pending_.end()) {
        LOG_DEBUG(log_, "no pending request for response " << id_it->get<std::string>());
        return false;
    }

    ResponseCallback callback = std::move(pending_it->second);
    pending_.erase(pending_it);

    if (!callback) {
        return false;
    }

    try {
        callback(status_it->get<bool>(), *results_it);
    } catch (const std::exception &e) {
        LOG_ERROR(log_, "callback for request " << id_it->get<std::string>() << " threw: " << e.what());
    }
    return true;
}

void RequestRouter::clear() {
    if (!pending_.empty()) {
        LOG_DEBUG(log_, "abandoning " << pending_.size() << " pending request(s)");
    }
    pending_.clear();
}

}  // namespace client
}  // namespace qode
