#include "NetworkUtils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/format.h>

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToHost(const std::string& host, int port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;      // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        std::cerr << "[NetworkUtils] DNS resolution failed for " << host
                  << ": " << gai_strerror(err) << "\n";
        return -1;
    }

    // Try each resolved address until one connects
    int sock_fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_fd < 0) continue;

        if (connect(sock_fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

        close(sock_fd);
        sock_fd = -1;
    }
    freeaddrinfo(res);

    if (sock_fd < 0) {
        std::cerr << "[NetworkUtils] Failed to connect to "
                  << host << ":" << port
                  << " (" << strerror(errno) << ")\n";
        return -1;
    }
    return sock_fd;
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length) {
    size_t total_sent = 0;

    while (total_sent < length) {
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[NetworkUtils] Send failed: " << strerror(errno) << "\n";
            return false;
        }

        if (sent == 0) {
            std::cerr << "[NetworkUtils] Connection closed during send\n";
            return false;
        }

        total_sent += sent;
    }

    return true;
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

ssize_t NetworkUtils::receiveData(int fd, char* buffer, size_t max_length, bool* out_timed_out) {
    if (out_timed_out) *out_timed_out = false;

    ssize_t received;
    do {
        received = recv(fd, buffer, max_length, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (out_timed_out) *out_timed_out = true;
            std::cerr << "[NetworkUtils] Receive timed out\n";
        } else {
            std::cerr << "[NetworkUtils] Receive failed: " << strerror(errno) << "\n";
        }
        return -1;
    }

    // 0 means the peer closed the connection (not necessarily an error)
    return received;
}

// ====================================================================================================
// Socket Configuration
// ====================================================================================================

bool NetworkUtils::setReceiveTimeout(int fd, int seconds) {
    struct timeval timeout;
    timeout.tv_sec = seconds;
    timeout.tv_usec = 0;

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "[NetworkUtils] Failed to set receive timeout: "
                  << strerror(errno) << "\n";
        return false;
    }

    return true;
}

std::string NetworkUtils::peerName(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        return fmt::format("{}:{}", host, ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return fmt::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
    return "local";
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
