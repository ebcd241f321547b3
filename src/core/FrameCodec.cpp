/**
 * @file FrameCodec.cpp
 * @brief Length-prefixed frame encoding
 */

#include "peerrelay/FrameCodec.h"

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

namespace PeerRelay {

bool writeFrame(TransportStream& stream, const std::string& payload, std::string& errorMsg) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        errorMsg = "Frame payload too large";
        return false;
    }

    const uint32_t len = static_cast<uint32_t>(payload.size());

    // Prefix and body go out in one buffer so a frame is never split by a
    // concurrent writer that does not hold the channel lock.
    std::vector<uint8_t> buffer(FRAME_LENGTH_PREFIX_SIZE + payload.size());
    buffer[0] = static_cast<uint8_t>((len >> 24) & 0xFF);
    buffer[1] = static_cast<uint8_t>((len >> 16) & 0xFF);
    buffer[2] = static_cast<uint8_t>((len >> 8) & 0xFF);
    buffer[3] = static_cast<uint8_t>(len & 0xFF);
    std::copy(payload.begin(), payload.end(), buffer.begin() + FRAME_LENGTH_PREFIX_SIZE);

    return stream.sendExact(buffer.data(), buffer.size(), errorMsg);
}

bool readFrame(TransportStream& stream,
               std::string& payload,
               size_t maxBytes,
               std::string& errorMsg) {
    std::array<uint8_t, FRAME_LENGTH_PREFIX_SIZE> prefix{};
    if (!stream.recvExact(prefix.data(), prefix.size(), errorMsg)) {
        return false;
    }

    const uint32_t len = (static_cast<uint32_t>(prefix[0]) << 24) |
                         (static_cast<uint32_t>(prefix[1]) << 16) |
                         (static_cast<uint32_t>(prefix[2]) << 8) |
                         static_cast<uint32_t>(prefix[3]);

    if (len > maxBytes) {
        errorMsg = "Frame of " + std::to_string(len) + " bytes exceeds limit of " +
                   std::to_string(maxBytes);
        return false;
    }

    payload.assign(len, '\0');
    if (len == 0) {
        return true;
    }
    return stream.recvExact(reinterpret_cast<uint8_t*>(&payload[0]), len, errorMsg);
}

}  // namespace PeerRelay
