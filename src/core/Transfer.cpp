/**
 * @file Transfer.cpp
 * @brief Transfer record helpers and string conversions
 */

#include "peerrelay/Transfer.h"

#include <cmath>
#include <stdexcept>

namespace PeerRelay {

std::string transferMethodToString(TransferMethod method) {
    switch (method) {
        case TransferMethod::DIRECT:  return "direct";
        case TransferMethod::RELAYED: return "relayed";
        default:                      return "unknown";
    }
}

std::string transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING:   return "pending";
        case TransferStatus::ACTIVE:    return "active";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED:    return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
        default:                        return "unknown";
    }
}

std::string transferRoleToString(TransferRole role) {
    return role == TransferRole::SENDER ? "sender" : "receiver";
}

std::string terminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::CLIENT_CANCELLED:  return "cancelled_by_peer";
        case TerminationReason::REJECTED:          return "rejected";
        case TerminationReason::PEER_DISCONNECTED: return "peer_disconnected";
        default:                                   return "unknown";
    }
}

std::optional<TransferMethod> transferMethodFromString(const std::string& value) {
    if (value == "direct") {
        return TransferMethod::DIRECT;
    }
    if (value == "relayed") {
        return TransferMethod::RELAYED;
    }
    return std::nullopt;
}

std::optional<TransferRole> transferRoleFromString(const std::string& value) {
    if (value == "sender") {
        return TransferRole::SENDER;
    }
    if (value == "receiver") {
        return TransferRole::RECEIVER;
    }
    return std::nullopt;
}

//=============================================================================
// FileDescriptor
//=============================================================================

namespace {

uint64_t readCount(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return 0;
    }
    const auto& v = obj[key];
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>();
    }
    if (v.is_number_integer()) {
        const int64_t n = v.get<int64_t>();
        if (n < 0) {
            throw std::invalid_argument(std::string("file_info.") + key + " must not be negative");
        }
        return static_cast<uint64_t>(n);
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!(d >= 0.0)) {
            throw std::invalid_argument(std::string("file_info.") + key + " must not be negative");
        }
        // 2^64 is exactly representable; anything at or above it cannot be cast.
        if (d >= 18446744073709551616.0 || std::floor(d) != d) {
            throw std::invalid_argument(std::string("file_info.") + key + " must be a whole number in range");
        }
        return static_cast<uint64_t>(d);
    }
    throw std::invalid_argument(std::string("file_info.") + key + " must be a number");
}

std::string readText(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return {};
    }
    if (!obj[key].is_string()) {
        throw std::invalid_argument(std::string("file_info.") + key + " must be a string");
    }
    return obj[key].get<std::string>();
}

} // anonymous namespace

FileDescriptor FileDescriptor::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("file_info must be an object");
    }

    FileDescriptor fd;
    fd.raw = j;
    fd.name = readText(j, "name");
    fd.size = readCount(j, "size");
    fd.mimeType = readText(j, "mime_type");
    if (fd.mimeType.empty()) {
        fd.mimeType = readText(j, "type");
    }
    fd.totalChunks = readCount(j, "total_chunks");
    fd.chunkSize = readCount(j, "chunk_size");
    return fd;
}

//=============================================================================
// Transfer
//=============================================================================

nlohmann::json toJson(const Transfer& transfer) {
    nlohmann::json out;
    out["transfer_id"] = transfer.id;
    out["sender_id"] = transfer.senderId;
    out["receiver_id"] = transfer.receiverId;
    out["file_info"] = transfer.fileInfo.raw;
    out["method"] = transferMethodToString(transfer.method);
    out["status"] = transferStatusToString(transfer.status);
    out["sender_progress"] = transfer.senderProgress;
    out["receiver_progress"] = transfer.receiverProgress;
    out["sender_chunks"] = transfer.senderChunks;
    out["receiver_chunks"] = transfer.receiverChunks;
    out["chunks_sent"] = transfer.chunksSent;
    out["chunks_acknowledged"] = transfer.chunksAcknowledged;
    out["total_chunks"] = transfer.fileInfo.totalChunks;
    out["duplicate_chunks"] = transfer.duplicateChunks;
    out["sync_lag"] = transfer.syncLag();
    if (!transfer.failureReason.empty()) {
        out["reason"] = transfer.failureReason;
    }
    return out;
}

double clampProgress(double value) {
    if (std::isnan(value) || value < 0.0) {
        return 0.0;
    }
    if (value > 100.0) {
        return 100.0;
    }
    return value;
}

}  // namespace PeerRelay
