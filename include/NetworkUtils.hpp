#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Common socket helpers shared by client and server
 *
 * Provides:
 * - Outbound TCP connections (DNS resolution, IPv4/IPv6)
 * - Full sends that survive partial writes
 * - Single receives with EOF/error reporting
 * - Receive timeouts and peer naming for the activity log
 *
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Connect to a remote host
     *
     * @param host Hostname or IP address
     * @param port Port number
     * @return Socket file descriptor on success, -1 on failure
     */
    static int connectToHost(const std::string& host, int port);

    /**
     * Send complete data to socket
     *
     * Loops over partial sends. SIGPIPE is suppressed so a vanished
     * peer shows up as a false return instead of killing the process.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Receive up to max_length bytes from socket
     *
     * @param fd Socket file descriptor
     * @param buffer Buffer to store received data
     * @param max_length Maximum bytes to receive
     * @param out_timed_out If given, set to whether a -1 was caused by the receive timeout
     * @return Number of bytes received, 0 on EOF, -1 on error or timeout
     */
    static ssize_t receiveData(int fd, char* buffer, size_t max_length, bool* out_timed_out = nullptr);

    /**
     * Set (or clear, with 0) the receive timeout
     *
     * @param fd Socket file descriptor
     * @param seconds Timeout in seconds, 0 disables it
     * @return true on success, false on failure
     */
    static bool setReceiveTimeout(int fd, int seconds);

    /**
     * Describe the remote end of a connected socket as "addr:port"
     *
     * @param fd Socket file descriptor
     * @return Peer description, or "unknown" if it cannot be determined
     */
    static std::string peerName(int fd);

    /**
     * Get last socket error as string
     *
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
