#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <string>

struct addrinfo;


/**
 * BaseServer - Listening socket plus one detached thread per client
 *
 * Derived classes implement handleRequest(), which owns the client
 * descriptor and must close it.
 */
class BaseServer{
public:
    BaseServer(const std::string& bind_address, int port);
    virtual ~BaseServer();

    /** Bind, listen and serve forever; false if the listener could not be opened */
    bool start();

    int acceptConnection();

protected:
    int socket_fd;
    std::string bind_address;
    int server_port;

    // Runs on its own thread and owns client_fd from here on
    virtual void handleRequest(int client_fd) = 0;

private:
    bool openListener();
    bool abandonListener(addrinfo* res);
    void acceptLoop();

    static void* threadEntry(void* arg);
};

#endif // BASE_SERVER_HPP
