#ifndef BASE_CLIENT_HPP
#define BASE_CLIENT_HPP

#include <memory>
#include <string>

#include "Connection.hpp"


class BaseClient {
public:
    BaseClient(const std::string& ip, int port);
    virtual ~BaseClient();

    bool start();
    void disconnect();

protected:
    std::unique_ptr<SocketConnection> connection;
    std::string server_ip;
    int server_port;

    virtual void makeRequest() = 0;
};

#endif // BASE_CLIENT_HPP
