#ifndef FILE_SERVER_HPP
#define FILE_SERVER_HPP

#include "BaseServer.hpp"
#include "Config.hpp"
#include "Logger.hpp"

#include <atomic>


class FileServer : public BaseServer {
public:
    explicit FileServer(const ServerConfig& config);
    ~FileServer() override = default;

protected:
    void handleRequest(int client_fd) override;

private:
    ServerConfig config;
    Logger logger;
    std::atomic<int> connected_clients{0};
};

#endif // FILE_SERVER_HPP
