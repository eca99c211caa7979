#pragma once

#include <string>

namespace qode {
namespace client {

/**
 * @brief Failure kinds reported by the client
 *
 * Fatal kinds stop the client until the next start():
 * - INVALID_SCRIPT, SPAWN_ERROR -> the worker could not be launched
 * - RETRY_EXHAUSTED -> the worker never accepted a connection
 *
 * Transient kinds leave the client usable or recoverable:
 * - CONNECTION_REFUSED -> retried automatically; only seen in last_error_code()
 *   while a retry is pending, never emitted
 * - SOCKET_ERROR -> connection dropped, start() again
 * - NOT_CONNECTED -> local precondition failure
 * - MALFORMED_MESSAGE -> frame skipped, connection continues
 * - PROCESS_ERROR -> worker crashed or its output could not be read
 */
enum class ErrorCode {
    OK,
    INVALID_SCRIPT,
    SPAWN_ERROR,
    CONNECTION_REFUSED,
    SOCKET_ERROR,
    RETRY_EXHAUSTED,
    NOT_CONNECTED,
    MALFORMED_MESSAGE,
    PROCESS_ERROR
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::INVALID_SCRIPT:
            return "INVALID_SCRIPT";
        case ErrorCode::SPAWN_ERROR:
            return "SPAWN_ERROR";
        case ErrorCode::CONNECTION_REFUSED:
            return "CONNECTION_REFUSED";
        case ErrorCode::SOCKET_ERROR:
            return "SOCKET_ERROR";
        case ErrorCode::RETRY_EXHAUSTED:
            return "RETRY_EXHAUSTED";
        case ErrorCode::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case ErrorCode::MALFORMED_MESSAGE:
            return "MALFORMED_MESSAGE";
        case ErrorCode::PROCESS_ERROR:
            return "PROCESS_ERROR";
        default:
            return "UNKNOWN";
    }
}

// Worker could not be launched (missing script or OS refusal)
inline bool is_spawn_error(ErrorCode code) {
    return code == ErrorCode::INVALID_SCRIPT || code == ErrorCode::SPAWN_ERROR;
}

inline bool is_fatal(ErrorCode code) { return is_spawn_error(code) || code == ErrorCode::RETRY_EXHAUSTED; }

}  // namespace client
}  // namespace qode
