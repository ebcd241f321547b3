/**
 * @file TransportStream.cpp
 * @brief POSIX socket stream implementation
 */

#include "peerrelay/TransportStream.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace PeerRelay {

PlainSocketStream::~PlainSocketStream() {
    if (m_socket >= 0) {
        ::close(m_socket);
        m_socket = -1;
    }
}

bool PlainSocketStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::send(m_socket, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "send() timed out";
            } else {
                errorMsg = std::string("send() failed: ") + std::strerror(errno);
            }
            return false;
        }
        if (n == 0) {
            errorMsg = "send() returned 0";
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool PlainSocketStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    size_t received = 0;
    while (received < size) {
        const ssize_t n = ::recv(m_socket, buffer + received, size - received, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = std::string("recv() failed: ") + std::strerror(errno);
            return false;
        }
        if (n == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        received += static_cast<size_t>(n);
    }
    return true;
}

void PlainSocketStream::shutdown() {
    bool expected = false;
    if (m_shutdown.compare_exchange_strong(expected, true)) {
        (void)::shutdown(m_socket, SHUT_RDWR);
    }
}

bool setSocketSendTimeout(int socketFd, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return ::setsockopt(socketFd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

}  // namespace PeerRelay
