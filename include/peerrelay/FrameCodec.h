/**
 * @file FrameCodec.h
 * @brief Length-prefixed frame encoding for relay messages
 *
 * Frame Layout:
 * - Offset 0-3: Payload length (uint32, network byte order)
 * - Offset 4-:  UTF-8 JSON payload
 */

#pragma once

#include "config.h"
#include "TransportStream.h"
#include <string>

namespace PeerRelay {

/**
 * @brief Write one frame
 * @return false if the payload exceeds 4 GiB or the stream failed
 */
bool writeFrame(TransportStream& stream, const std::string& payload, std::string& errorMsg);

/**
 * @brief Read one frame
 * @param maxBytes Payload size limit; larger frames fail without reading the body
 * @return false on stream failure, clean close, or an oversized frame
 */
bool readFrame(TransportStream& stream,
               std::string& payload,
               size_t maxBytes,
               std::string& errorMsg);

}  // namespace PeerRelay
