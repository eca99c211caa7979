#include "frame_codec.hpp"

#include <algorithm>
#include <cstring>

namespace qode {
namespace protocol {

void FrameBuffer::reset() {
    header_complete = false;
    header_bytes.clear();
    payload_remaining = 0;
    payload_bytes.clear();
}

bool encode_frame(const nlohmann::json &message, std::string &out, std::string &error) {
    std::string payload;
    try {
        payload = message.dump();
    } catch (const nlohmann::json::exception &e) {
        error = "Failed to serialize message: " + std::string(e.what());
        return false;
    }

    if (payload.size() > kMaxFrameSize) {
        error = "Frame too large: " + std::to_string(payload.size()) + " bytes";
        return false;
    }

    uint32_t len32 = static_cast<uint32_t>(payload.size());
    char len_buf[kHeaderSize];
    std::memcpy(len_buf, &len32, kHeaderSize);

    out.clear();
    out.reserve(kHeaderSize + payload.size());
    out.append(len_buf, kHeaderSize);
    out.append(payload);
    return true;
}

namespace {

DecodedFrame decode_payload(const std::string &payload) {
    DecodedFrame frame;
    try {
        frame.message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error &e) {
        frame.error = FrameError::MALFORMED;
        frame.error_message = "Malformed message (" + std::to_string(payload.size()) + " bytes): " + e.what();
    }
    return frame;
}

}  // namespace

std::vector<DecodedFrame> feed(FrameBuffer &buffer, const char *data, size_t len) {
    std::vector<DecodedFrame> frames;
    size_t offset = 0;

    while (offset < len) {
        if (!buffer.header_complete) {
            size_t wanted = kHeaderSize - buffer.header_bytes.size();
            size_t take = std::min(wanted, len - offset);
            buffer.header_bytes.append(data + offset, take);
            offset += take;

            if (buffer.header_bytes.size() < kHeaderSize) {
                break;  // header split across reads
            }

            uint32_t payload_len = 0;
            std::memcpy(&payload_len, buffer.header_bytes.data(), kHeaderSize);
            if (payload_len > kMaxFrameSize) {
                DecodedFrame frame;
                frame.error = FrameError::OVERSIZED;
                frame.error_message = "Frame too large: " + std::to_string(payload_len) + " bytes";
                frames.push_back(std::move(frame));
                buffer.reset();
                return frames;
            }

            buffer.header_complete = true;
            buffer.header_bytes.clear();
            buffer.payload_remaining = payload_len;
            buffer.payload_bytes.clear();
            buffer.payload_bytes.reserve(payload_len);
        }

        size_t take = std::min<size_t>(buffer.payload_remaining, len - offset);
        buffer.payload_bytes.append(data + offset, take);
        buffer.payload_remaining -= static_cast<uint32_t>(take);
        offset += take;

        if (buffer.payload_remaining == 0) {
            frames.push_back(decode_payload(buffer.payload_bytes));
            buffer.reset();
        }
    }

    return frames;
}

std::vector<DecodedFrame> feed(FrameBuffer &buffer, const std::string &data) {
    return feed(buffer, data.data(), data.size());
}

}  // namespace protocol
}  // namespace qode
