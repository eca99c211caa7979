#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace qode {
namespace protocol {

// Frames are: uint32 (native byte order, payload length) + UTF-8 JSON payload.
constexpr size_t kHeaderSize = 4;

// Maximum payload size: 64 MiB (whole documents travel in requests)
constexpr uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

enum class FrameError {
    NONE,
    MALFORMED,  // payload is not valid UTF-8 JSON; framing continues
    OVERSIZED   // declared length above kMaxFrameSize; stream is unusable
};

// Incremental decode state. Reset after every complete frame.
struct FrameBuffer {
    bool header_complete = false;
    std::string header_bytes;  // at most kHeaderSize bytes
    uint32_t payload_remaining = 0;
    std::string payload_bytes;

    void reset();
};

// One decoded frame: either a message or the reason it could not be decoded
struct DecodedFrame {
    std::optional<nlohmann::json> message;
    FrameError error = FrameError::NONE;
    std::string error_message;

    bool ok() const { return message.has_value(); }
};

// Serialize message and prepend the length header.
// Returns false (sets error) for invalid UTF-8 or oversized payloads.
bool encode_frame(const nlohmann::json &message, std::string &out, std::string &error);

// Consume a chunk of bytes of any size. Returns every frame completed by
// this chunk, in stream order. Bytes of an incomplete frame stay in buffer.
// After an OVERSIZED result the remaining bytes of the chunk are discarded.
std::vector<DecodedFrame> feed(FrameBuffer &buffer, const char *data, size_t len);

std::vector<DecodedFrame> feed(FrameBuffer &buffer, const std::string &data);

}  // namespace protocol
}  // namespace qode
