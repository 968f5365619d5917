#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "Connection.hpp"
#include "Protocol.hpp"

/**
 * Result of one chunked transfer
 */
struct TransferOutcome {
    uint64_t bytes_transferred = 0;
    bool success = false;
    Protocol::StatusCode reason = Protocol::StatusCode::OK;
    std::string message;

    // Set when the stream itself broke; the connection must be dropped
    Protocol::CodecError protocol_error = Protocol::CodecError::NONE;

    // Receiver only: the sender ended the transfer with a STATUS instead of
    // END. reason/message then hold the sender's status, which also serves
    // as the terminal status of the command.
    bool peer_aborted = false;
};

/**
 * TransferEngine - Chunked file and listing streams over a Connection
 *
 * A transfer on the wire is zero or more CHUNK frames followed by one END
 * frame. A sender that cannot finish (local read error) sends no END; its
 * next frame is a STATUS, which the receiver treats as an abort.
 *
 * Receivers write into a temporary file beside the destination and rename
 * it into place only when END arrives, so an interrupted transfer never
 * leaves a partial file under the destination name. Content and file
 * extensions are never inspected.
 */
class TransferEngine {
public:
    /**
     * Stream a local file as CHUNK frames and an END frame
     *
     * A missing or non-regular source fails with FILE_NOT_FOUND before any
     * frame is written. A read failure midway fails with IO_ERROR and
     * leaves the END frame unsent; the caller must follow up with a STATUS.
     */
    static TransferOutcome sendFile(Connection& conn, const std::filesystem::path& source);

    /**
     * Receive CHUNK frames until END and place them at destination
     *
     * Fails with DIRECTORY_NOT_FOUND, without writing anything, if the
     * parent directory does not exist. The incoming stream is always
     * consumed up to its END (or abort STATUS) so the connection stays
     * frame-aligned after a recoverable failure.
     */
    static TransferOutcome receiveFile(Connection& conn, const std::filesystem::path& destination);

    /**
     * Read and drop an incoming transfer up to its END or abort STATUS
     */
    static TransferOutcome discardTransfer(Connection& conn);

    /** Stream entry names, one CHUNK per name, followed by END */
    static TransferOutcome sendEntries(Connection& conn, const std::vector<std::string>& entries);

    /** Counterpart of sendEntries(); bytes_transferred counts entries */
    static TransferOutcome receiveEntries(Connection& conn, std::vector<std::string>& out);

private:
    TransferEngine() = delete;
};

#endif // TRANSFER_ENGINE_HPP
