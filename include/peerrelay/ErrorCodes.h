/**
 * @file ErrorCodes.h
 * @brief Stable, machine-readable error codes returned in `error` replies.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

#include <string>
#include <utility>

namespace PeerRelay {
namespace ErrorCodes {

// Routing / identity
inline constexpr const char* UNKNOWN_PEER = "UNKNOWN_PEER";
inline constexpr const char* DUPLICATE_IDENTITY = "DUPLICATE_IDENTITY";
inline constexpr const char* IDENTITY_SPOOFING = "IDENTITY_SPOOFING";
inline constexpr const char* NOT_REGISTERED = "NOT_REGISTERED";

// Signaling
inline constexpr const char* NO_MATCHING_OFFER = "NO_MATCHING_OFFER";

// Transfers
inline constexpr const char* INVALID_STATE = "INVALID_STATE";
inline constexpr const char* UNKNOWN_TRANSFER = "UNKNOWN_TRANSFER";

// Envelope
inline constexpr const char* MALFORMED_MESSAGE = "MALFORMED_MESSAGE";

}  // namespace ErrorCodes

/**
 * @brief Recoverable operation failure reported back to the request origin.
 *
 * Component operations return bool and fill this on failure.
 */
struct RelayError {
    std::string code;     ///< One of ErrorCodes::*
    std::string message;  ///< Human-readable detail

    void set(const char* errorCode, std::string text) {
        code = errorCode;
        message = std::move(text);
    }

    bool empty() const { return code.empty(); }
};

}  // namespace PeerRelay
