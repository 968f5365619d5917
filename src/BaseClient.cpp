#include <iostream>

#include "BaseClient.hpp"
#include "NetworkUtils.hpp"


BaseClient::BaseClient(const std::string& ip, int port)
    : server_ip{ip}, server_port{port} {}


BaseClient::~BaseClient() {
    disconnect();
}


bool BaseClient::start() {
    std::cout << "Connecting to " << server_ip << " on port " << server_port << "...\n";

    // Resolve and Connect to the Server
    int socket_fd = NetworkUtils::connectToHost(server_ip, server_port);
    if (socket_fd < 0) {
        std::cerr << "Error: Failed to connect to server at "
                  << server_ip << ":" << server_port << "\n";
        return false;
    }
    connection = std::make_unique<SocketConnection>(socket_fd);
    std::cout << "Successfully connected to " << server_ip << " on port " << server_port << "\n";

    // Make the Request (Implemented by Derived Class)
    makeRequest();
    return true;
}


void BaseClient::disconnect() {
    if (connection) {
        connection.reset();
        std::cout << "Disconnected from server\n";
    }
}
