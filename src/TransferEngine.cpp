#include "TransferEngine.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "FrameCodec.hpp"

namespace fs = std::filesystem;

using Protocol::CodecError;
using Protocol::Frame;
using Protocol::FrameType;
using Protocol::StatusCode;

namespace {

    std::atomic<uint64_t> g_partial_counter{0};

    /**
     * Temporary file beside the destination; removed unless committed
     *
     * Its name has a fixed length, independent of the destination's.
     */
    class PartialFile {
    public:
        explicit PartialFile(const fs::path& destination)
            : destination{destination},
              temp_path{destination.parent_path() /
                        fmt::format(".sfmp-{}-{}.part", static_cast<long>(getpid()), ++g_partial_counter)} {
            out.open(temp_path, std::ios::binary | std::ios::trunc);
        }

        ~PartialFile() { discard(); }

        PartialFile(const PartialFile&) = delete;
        PartialFile& operator=(const PartialFile&) = delete;

        bool isOpen() const { return out.is_open(); }

        bool write(const std::vector<char>& data) {
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            return out.good();
        }

        bool commit(std::string& error) {
            out.close();
            if (out.fail()) {
                error = "failed to flush temporary file";
                return false;
            }

            std::error_code ec;
            fs::rename(temp_path, destination, ec);
            if (ec) {
                error = ec.message();
                return false;
            }
            done = true;
            return true;
        }

        void discard() {
            if (done) return;
            done = true;
            if (out.is_open()) out.close();

            std::error_code ec;
            fs::remove(temp_path, ec);
            if (ec) {
                std::cerr << "[TransferEngine] Could not remove " << temp_path
                          << ": " << ec.message() << "\n";
            }
        }

    private:
        fs::path destination;
        fs::path temp_path;
        std::ofstream out;
        bool done = false;
    };

    /**
     * Read frames until END (returns true) or until the transfer is aborted
     * or the stream breaks (returns false, outcome filled in). on_chunk is
     * handed every CHUNK payload.
     */
    template<typename ChunkHandler>
    bool readTransfer(Connection& conn, TransferOutcome& outcome, ChunkHandler on_chunk) {
        while (true) {
            Frame frame;
            CodecError err = FrameCodec::readFrame(conn, frame);
            if (err != CodecError::NONE) {
                // Dropping mid-transfer is never clean
                outcome.protocol_error = err == CodecError::CONNECTION_CLOSED
                                             ? CodecError::UNEXPECTED_EOF : err;
                outcome.success = false;
                outcome.reason = StatusCode::IO_ERROR;
                outcome.message = Protocol::codecErrorName(outcome.protocol_error);
                return false;
            }

            switch (frame.type) {
                case FrameType::CHUNK:
                    on_chunk(frame.payload);
                    break;

                case FrameType::END:
                    return true;

                case FrameType::STATUS: {
                    StatusCode code;
                    std::string message;
                    if (!frame.parseStatus(code, message)) {
                        outcome.protocol_error = CodecError::MALFORMED_PAYLOAD;
                        return false;
                    }
                    outcome.peer_aborted = true;
                    outcome.success = false;
                    outcome.reason = code;
                    outcome.message = message;
                    return false;
                }

                case FrameType::COMMAND:
                    outcome.protocol_error = CodecError::OUT_OF_ORDER;
                    outcome.success = false;
                    outcome.reason = StatusCode::IO_ERROR;
                    outcome.message = Protocol::codecErrorName(CodecError::OUT_OF_ORDER);
                    return false;
            }
        }
    }

    TransferOutcome failed(StatusCode reason, std::string message) {
        TransferOutcome outcome;
        outcome.success = false;
        outcome.reason = reason;
        outcome.message = std::move(message);
        return outcome;
    }

    // Drain the rest of a transfer but keep the local failure as the result
    TransferOutcome failAndDrain(Connection& conn, StatusCode reason, std::string message) {
        TransferOutcome drained = TransferEngine::discardTransfer(conn);
        TransferOutcome outcome = failed(reason, std::move(message));
        outcome.protocol_error = drained.protocol_error;
        outcome.peer_aborted = drained.peer_aborted;
        return outcome;
    }

} // namespace


// ====================================================================================================
// Sending
// ====================================================================================================

TransferOutcome TransferEngine::sendFile(Connection& conn, const fs::path& source) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return failed(StatusCode::FILE_NOT_FOUND,
                      fmt::format("File '{}' does not exist", source.filename().string()));
    }

    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return failed(StatusCode::IO_ERROR,
                      fmt::format("File '{}' could not be opened", source.filename().string()));
    }

    TransferOutcome outcome;
    std::vector<char> buffer(Protocol::CHUNK_SIZE);

    while (true) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();

        if (n > 0) {
            CodecError err = FrameCodec::writeFrame(conn, Frame::chunk(buffer.data(), static_cast<size_t>(n)));
            if (err != CodecError::NONE) {
                outcome.protocol_error = err;
                outcome.reason = StatusCode::IO_ERROR;
                outcome.message = Protocol::codecErrorName(err);
                return outcome;
            }
            outcome.bytes_transferred += static_cast<uint64_t>(n);
        }

        if (file.bad()) {
            // END stays unsent; the caller's STATUS aborts the transfer
            outcome.reason = StatusCode::IO_ERROR;
            outcome.message = fmt::format("Read of '{}' failed after {} bytes",
                                          source.filename().string(), outcome.bytes_transferred);
            return outcome;
        }
        if (file.eof()) break;
    }

    CodecError err = FrameCodec::writeFrame(conn, Frame::end());
    if (err != CodecError::NONE) {
        outcome.protocol_error = err;
        outcome.reason = StatusCode::IO_ERROR;
        outcome.message = Protocol::codecErrorName(err);
        return outcome;
    }

    outcome.success = true;
    outcome.reason = StatusCode::OK;
    outcome.message = fmt::format("{} bytes transferred", outcome.bytes_transferred);
    return outcome;
}


TransferOutcome TransferEngine::sendEntries(Connection& conn, const std::vector<std::string>& entries) {
    TransferOutcome outcome;

    for (const std::string& name : entries) {
        CodecError err = FrameCodec::writeFrame(conn, Frame::chunk(name.data(), name.size()));
        if (err != CodecError::NONE) {
            outcome.protocol_error = err;
            outcome.reason = StatusCode::IO_ERROR;
            outcome.message = Protocol::codecErrorName(err);
            return outcome;
        }
        ++outcome.bytes_transferred;
    }

    CodecError err = FrameCodec::writeFrame(conn, Frame::end());
    if (err != CodecError::NONE) {
        outcome.protocol_error = err;
        outcome.reason = StatusCode::IO_ERROR;
        outcome.message = Protocol::codecErrorName(err);
        return outcome;
    }

    outcome.success = true;
    outcome.message = fmt::format("{} entries", entries.size());
    return outcome;
}


// ====================================================================================================
// Receiving
// ====================================================================================================

TransferOutcome TransferEngine::receiveFile(Connection& conn, const fs::path& destination) {
    std::error_code ec;
    fs::path parent = destination.parent_path();

    // Refuse before touching any chunk data
    if (!fs::is_directory(parent, ec)) {
        return failAndDrain(conn, StatusCode::DIRECTORY_NOT_FOUND,
                            fmt::format("Directory '{}' does not exist", parent.string()));
    }
    if (fs::is_directory(destination, ec)) {
        return failAndDrain(conn, StatusCode::IO_ERROR,
                            fmt::format("'{}' is a directory", destination.filename().string()));
    }

    PartialFile partial(destination);
    if (!partial.isOpen()) {
        return failAndDrain(conn, StatusCode::IO_ERROR,
                            fmt::format("Cannot create file in '{}'", parent.string()));
    }

    TransferOutcome outcome;
    bool write_failed = false;

    bool complete = readTransfer(conn, outcome, [&](const std::vector<char>& data) {
        if (write_failed) return;
        if (!partial.write(data)) {
            write_failed = true;
            return;
        }
        outcome.bytes_transferred += data.size();
    });

    if (!complete) {
        partial.discard();
        return outcome;
    }

    if (write_failed) {
        partial.discard();
        outcome.reason = StatusCode::IO_ERROR;
        outcome.message = fmt::format("Write to '{}' failed after {} bytes",
                                      destination.filename().string(), outcome.bytes_transferred);
        return outcome;
    }

    std::string error;
    if (!partial.commit(error)) {
        outcome.reason = StatusCode::IO_ERROR;
        outcome.message = fmt::format("Could not place '{}': {}", destination.filename().string(), error);
        return outcome;
    }

    outcome.success = true;
    outcome.reason = StatusCode::OK;
    outcome.message = fmt::format("{} bytes transferred", outcome.bytes_transferred);
    return outcome;
}


TransferOutcome TransferEngine::discardTransfer(Connection& conn) {
    TransferOutcome outcome;
    bool complete = readTransfer(conn, outcome, [&](const std::vector<char>& data) {
        outcome.bytes_transferred += data.size();
    });
    if (complete) {
        outcome.reason = StatusCode::OK;
        outcome.message = fmt::format("{} bytes discarded", outcome.bytes_transferred);
    }
    // Nothing was kept, so this is never a success
    outcome.success = false;
    return outcome;
}


TransferOutcome TransferEngine::receiveEntries(Connection& conn, std::vector<std::string>& out) {
    out.clear();

    TransferOutcome outcome;
    bool complete = readTransfer(conn, outcome, [&](const std::vector<char>& data) {
        out.emplace_back(data.begin(), data.end());
        ++outcome.bytes_transferred;
    });

    if (!complete) {
        out.clear();
        return outcome;
    }

    outcome.success = true;
    outcome.reason = StatusCode::OK;
    outcome.message = fmt::format("{} entries", out.size());
    return outcome;
}
