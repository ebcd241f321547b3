/**
 * @file UuidGenerator.h
 * @brief Random identifier generation for transfers and connections
 *
 * Provides centralized id generation so TransferManager and RelayServer
 * produce ids from the same CSPRNG.
 */

#pragma once

#include <string>
#include <iomanip>
#include <array>
#include <cstdint>
#include <sstream>

#include <openssl/rand.h>

namespace PeerRelay {

/**
 * @class UuidGenerator
 * @brief Thread-safe UUID version 4 generator
 *
 * Generates random UUIDs conforming to RFC 4122 version 4 format:
 * xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 *
 * Thread Safety:
 * - The static methods are thread-safe (OpenSSL RAND_bytes is thread-safe)
 */
class UuidGenerator {
public:
    /**
     * @brief Generate a random UUID v4
     * @return UUID string, or empty string if the CSPRNG failed
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        if (!fillRandom(bytes.data(), bytes.size())) {
            return {};
        }

        // RFC 4122 version 4
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        // RFC 4122 variant (10xx)
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        return formatUuid(bytes);
    }

    /**
     * @brief Generate a prefixed ID (e.g., "xfer_1a2b-3c4d-5e6f-7a8b")
     * @param prefix String prefix to prepend
     * @return Prefixed ID string, or empty string if the CSPRNG failed
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 8> bytes{};
        if (!fillRandom(bytes.data(), bytes.size())) {
            return {};
        }

        std::ostringstream oss;
        oss << prefix << std::hex << std::setfill('0');

        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 2 || i == 4 || i == 6) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }

        return oss.str();
    }

private:
    // Private constructor - all methods are static
    UuidGenerator() = delete;

    static bool fillRandom(uint8_t* out, size_t len) {
        if (!out || len == 0) {
            return false;
        }
        return RAND_bytes(out, static_cast<int>(len)) == 1;
    }

    static std::string formatUuid(const std::array<uint8_t, 16>& bytes) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');

        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }

        return oss.str();
    }
};

}  // namespace PeerRelay
