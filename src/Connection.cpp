#include "Connection.hpp"

#include <unistd.h>

#include "NetworkUtils.hpp"


bool Connection::readExact(char* buffer, size_t length, size_t& out_received) {
    out_received = 0;
    while (out_received < length) {
        ssize_t n = readSome(buffer + out_received, length - out_received);
        if (n <= 0) return false;
        out_received += static_cast<size_t>(n);
    }
    return true;
}


SocketConnection::SocketConnection(int socket_fd)
    : socket_fd{socket_fd}, peer_name{NetworkUtils::peerName(socket_fd)} {}

SocketConnection::~SocketConnection() {
    close();
}

ssize_t SocketConnection::readSome(char* buffer, size_t max_length) {
    if (socket_fd == -1) return -1;
    return NetworkUtils::receiveData(socket_fd, buffer, max_length, &timed_out);
}

bool SocketConnection::writeAll(const char* data, size_t length) {
    if (socket_fd == -1) return false;
    return NetworkUtils::sendData(socket_fd, data, length);
}

bool SocketConnection::setReadTimeout(int seconds) {
    if (socket_fd == -1) return false;
    return NetworkUtils::setReceiveTimeout(socket_fd, seconds);
}

void SocketConnection::close() {
    if (socket_fd != -1) {
        ::close(socket_fd);
        socket_fd = -1;
    }
}
