#include "FileServer.hpp"

#include "Connection.hpp"
#include "Session.hpp"

FileServer::FileServer(const ServerConfig& config)
    : BaseServer(config.bind_address, config.port),
      config{config},
      logger{"server", config.log_file} {
    logger.logCustomMsg("Serving files from " + this->config.root.string());
}


void FileServer::handleRequest(int client_fd) {
    SocketConnection conn(client_fd);
    const std::string peer = conn.peer();

    logger.logConnectionOpened(peer);
    logger.logClientCount(++connected_clients);

    // Session events carry the peer, so they share the server's logger
    Session session(conn, config.root, logger, config.idle_timeout);
    session.run();

    conn.close();
    logger.logConnectionClosed(peer);
    logger.logClientCount(--connected_clients);
}
