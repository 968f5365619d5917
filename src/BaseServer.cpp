#include <iostream>
#include <string>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>
#include <pthread.h>

#include "BaseServer.hpp"
#include "NetworkUtils.hpp"

namespace {

    // Handed to each connection thread, which deletes it
    struct ConnectionHandoff {
        BaseServer* server;
        int client_fd;
    };

} // namespace


BaseServer::BaseServer(const std::string& bind_address, int port)
    : socket_fd{-1}, bind_address{bind_address}, server_port{port} {}

BaseServer::~BaseServer() {
    if (socket_fd != -1) {
        close(socket_fd);
        std::cout << "Server shut down.\n";
    }
}

bool BaseServer::start() {
    if (!openListener()) return false;

    std::cout << "Server is listening for connections on " << bind_address
              << ":" << server_port << "...\n";
    acceptLoop();
    return true;
}

bool BaseServer::openListener() {
    // Resolve the Bind Address (IPv4 or IPv6 literal)
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    std::string port_str = std::to_string(server_port);
    int err = getaddrinfo(bind_address.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        std::cerr << "Error: Invalid listen address " << bind_address
                  << " (" << gai_strerror(err) << ")\n";
        return false;
    }

    // Create a TCP Socket
    socket_fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (socket_fd < 0) {
        std::cerr << "Error: Failed to create socket (" << NetworkUtils::getLastError() << ")\n";
        freeaddrinfo(res);
        return false;
    }

    // Allow Quick Restarts on the Same Port
    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "Error: Failed to set socket options\n";
        return abandonListener(res);
    }

    // Bind and Listen
    if (bind(socket_fd, res->ai_addr, res->ai_addrlen) < 0) {
        std::cerr << "Error: Failed to bind to " << bind_address << ":" << server_port
                  << " (" << NetworkUtils::getLastError() << ")\n";
        return abandonListener(res);
    }
    if (listen(socket_fd, SOMAXCONN) < 0) {
        std::cerr << "Error: Failed to listen on port " << server_port << "\n";
        return abandonListener(res);
    }

    freeaddrinfo(res);
    return true;
}

bool BaseServer::abandonListener(addrinfo* res) {
    freeaddrinfo(res);
    close(socket_fd);
    socket_fd = -1;
    return false;
}

void BaseServer::acceptLoop() {
    while (true) {
        int client_fd = acceptConnection();
        if (client_fd < 0) {
            continue; // Accept failed, try again
        }

        // One Detached Thread per Client
        auto* handoff = new ConnectionHandoff{this, client_fd};
        pthread_t thread_id;
        if (pthread_create(&thread_id, nullptr, BaseServer::threadEntry, handoff) != 0) {
            std::cerr << "Error: Failed to create thread\n";
            close(client_fd);
            delete handoff;
            continue;
        }
        pthread_detach(thread_id);
    }
}

int BaseServer::acceptConnection() {
    sockaddr_storage client_addr{};
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept(socket_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
        std::cerr << "Error: Failed to accept connection: " << NetworkUtils::getLastError() << "\n";
        return -1;
    }
    return client_fd;
}

void* BaseServer::threadEntry(void* arg) {
    auto* handoff = static_cast<ConnectionHandoff*>(arg);
    BaseServer* server = handoff->server;
    int client_fd = handoff->client_fd;
    delete handoff;

    server->handleRequest(client_fd);
    return nullptr;
}
