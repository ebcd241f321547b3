/**
 * @file config.h
 * @brief Configuration constants for PeerRelay
 *
 * This file contains the compile-time defaults used throughout the relay,
 * including the listening port, framing limits, timing values and
 * protocol identifiers. Most of the timing values can be overridden at
 * startup through RelayArgs.
 *
 * @note Changes to the framing constants affect wire compatibility.
 *       Ensure all clients use a compatible framing configuration.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace PeerRelay
 * @brief PeerRelay namespace containing all public APIs
 */
namespace PeerRelay {

//=========================================================================
// Network
//=========================================================================

/** @defgroup NetworkConfig Network Configuration
 * @{
 */

/**
 * @brief Default TCP port the relay listens on.
 *
 * Port 0 is accepted as well (OS-assigned ephemeral port), which is what
 * the loopback tests use.
 */
constexpr uint16_t RELAY_PORT_DEFAULT = 8750;

/**
 * @brief Default bind address (all IPv4 interfaces).
 */
constexpr const char* RELAY_BIND_ADDRESS_DEFAULT = "0.0.0.0";

/**
 * @brief listen() backlog for the relay socket.
 */
constexpr int LISTEN_BACKLOG = 128;

/**
 * @brief Maximum number of concurrently connected client sessions.
 *
 * Connections beyond this are closed immediately after accept().
 */
constexpr size_t MAX_CONCURRENT_CONNECTIONS = 1024;

/** @} */ // end of NetworkConfig

//=========================================================================
// Framing
//=========================================================================

/** @defgroup FramingConfig Framing Configuration
 * @brief Length-prefixed JSON frames
 *
 * Every message is a 4-byte big-endian length followed by that many bytes
 * of UTF-8 JSON. A frame exceeding the limit is connection-fatal.
 * @{
 */

constexpr size_t FRAME_LENGTH_PREFIX_SIZE = 4;

/**
 * @brief Default maximum frame payload (16 MiB).
 *
 * Relayed chunks are base64 inside JSON, so this bounds the chunk size a
 * client can push through the relay.
 */
constexpr size_t MAX_FRAME_BYTES_DEFAULT = 16u * 1024u * 1024u;

/**
 * @brief Protocol identifier reported in the `registered` reply.
 */
constexpr const char* PROTOCOL_ID = "PEERRELAY_V1";

/** @} */ // end of FramingConfig

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timing intervals and timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Send timeout applied to every client socket.
 *
 * A peer that stops reading cannot stall the sender forever; the send
 * fails and is reported as "peer unreachable".
 */
constexpr uint32_t SOCKET_SEND_TIMEOUT_MS = 10000;

/**
 * @brief Interval of the cleanup thread (transfer GC, stale sweep).
 */
constexpr uint32_t CLEANUP_INTERVAL_MS = 5000;

/**
 * @brief How long a terminal transfer is kept for a final status query.
 */
constexpr uint32_t TRANSFER_RETENTION_MS = 30000;

/**
 * @brief Endpoints silent for longer than this are disconnected.
 *
 * Clients are expected to send `ping` well within this window.
 */
constexpr uint32_t STALE_ENDPOINT_TIMEOUT_MS = 300000;  // 5 minutes

/**
 * @brief Poll granularity of the accept loop while waiting for stop.
 */
constexpr uint32_t ACCEPT_POLL_INTERVAL_MS = 100;

/** @} */ // end of Timing

//=========================================================================
// Limits
//=========================================================================

/**
 * @brief Maximum endpoint id length accepted at register time.
 */
constexpr size_t MAX_ENDPOINT_ID_LENGTH = 128;

/**
 * @brief Maximum device label length (longer labels are truncated).
 */
constexpr size_t MAX_DEVICE_NAME_LENGTH = 64;

}  // namespace PeerRelay
