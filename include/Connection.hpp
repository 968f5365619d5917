#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <cstddef>
#include <string>
#include <sys/types.h>

/**
 * Connection - Reliable, ordered byte stream used by the protocol core
 *
 * The core never touches sockets directly; it reads and writes through
 * this interface so sessions can run over TCP or over an in-memory
 * double in tests.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * Read whatever is available, blocking until at least one byte arrives
     *
     * @return Bytes read, 0 on orderly EOF, -1 on error or timeout
     */
    virtual ssize_t readSome(char* buffer, size_t max_length) = 0;

    /**
     * Write all bytes or fail
     *
     * @return true if every byte was handed to the transport
     */
    virtual bool writeAll(const char* data, size_t length) = 0;

    /**
     * Bound how long a read may block; 0 disables the bound
     *
     * @return false if the transport rejected the setting
     */
    virtual bool setReadTimeout(int seconds) = 0;

    /** Human readable description of the remote end */
    virtual std::string peer() const = 0;

    /** true if the most recent failed read hit the read timeout */
    virtual bool readTimedOut() const { return false; }

    /**
     * Read exactly length bytes, resuming after short reads
     *
     * @param out_received Bytes actually read (less than length on EOF/error)
     * @return true when all length bytes were read
     */
    bool readExact(char* buffer, size_t length, size_t& out_received);
};


/**
 * SocketConnection - Connection over a connected socket descriptor
 *
 * Owns the descriptor and closes it on destruction.
 */
class SocketConnection : public Connection {
public:
    explicit SocketConnection(int socket_fd);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    ssize_t readSome(char* buffer, size_t max_length) override;
    bool writeAll(const char* data, size_t length) override;
    bool setReadTimeout(int seconds) override;
    std::string peer() const override { return peer_name; }
    bool readTimedOut() const override { return timed_out; }

    void close();
    bool isOpen() const { return socket_fd != -1; }

private:
    int socket_fd;
    std::string peer_name;
    bool timed_out = false;
};

#endif // CONNECTION_HPP
