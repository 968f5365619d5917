#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include "Connection.hpp"
#include "FrameCodec.hpp"
#include "Protocol.hpp"
#include "SessionEvent.hpp"

namespace test_support {

    namespace fs = std::filesystem;

    /** Fresh directory under the system temp dir, removed with its contents */
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{0};
            path_ = fs::temp_directory_path() /
                    ("sfmp_test_" + std::to_string(getpid()) + "_" + std::to_string(++counter));
            fs::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }
        fs::path operator/(const std::string& name) const { return path_ / name; }

    private:
        fs::path path_;
    };

    inline void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    /** Deterministic binary content, every byte value included */
    inline std::string binaryContent(size_t size) {
        std::string data(size, '\0');
        uint32_t state = 12345;
        for (size_t i = 0; i < size; ++i) {
            state = state * 1103515245u + 12345u;
            data[i] = static_cast<char>(state >> 16);
        }
        return data;
    }

    /** Names in a directory, for checking that no temporary files were left */
    inline std::vector<std::string> listNames(const fs::path& dir) {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    /**
     * In-memory Connection: reads come from a prepared byte script (EOF once
     * it runs out), writes are captured. max_read caps every read so short
     * reads can be simulated.
     */
    class MemoryConnection : public Connection {
    public:
        explicit MemoryConnection(size_t max_read = 0) : max_read(max_read) {}

        void feed(const Protocol::Frame& frame) {
            std::vector<char> bytes = Protocol::encode(frame);
            input.insert(input.end(), bytes.begin(), bytes.end());
        }

        void feedRaw(const std::vector<char>& bytes) {
            input.insert(input.end(), bytes.begin(), bytes.end());
        }

        ssize_t readSome(char* buffer, size_t max_length) override {
            if (read_pos >= input.size()) return time_out_when_drained ? -1 : 0;
            size_t n = std::min(max_length, input.size() - read_pos);
            if (max_read > 0) n = std::min(n, max_read);
            std::memcpy(buffer, input.data() + read_pos, n);
            read_pos += n;
            return static_cast<ssize_t>(n);
        }

        bool writeAll(const char* data, size_t length) override {
            if (fail_writes) return false;
            output.insert(output.end(), data, data + length);
            return true;
        }

        bool setReadTimeout(int seconds) override {
            timeouts.push_back(seconds);
            return true;
        }

        std::string peer() const override { return "memory"; }

        bool readTimedOut() const override {
            return time_out_when_drained && read_pos >= input.size();
        }

        /** Everything written so far, as a Connection that can be read back */
        MemoryConnection replayOutput() const {
            MemoryConnection replay;
            replay.feedRaw(output);
            return replay;
        }

        bool fullyConsumed() const { return read_pos == input.size(); }

        std::vector<char> input;
        std::vector<char> output;
        std::vector<int> timeouts;
        size_t read_pos = 0;
        size_t max_read;
        bool fail_writes = false;
        bool time_out_when_drained = false;   // Simulates an expired read timeout instead of EOF
    };

    /** Two connected SocketConnections (AF_UNIX stream pair) */
    inline std::pair<int, int> makeSocketPair() {
        int fds[2] = {-1, -1};
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return {-1, -1};
        return {fds[0], fds[1]};
    }

    /** EventSink that keeps every event */
    class RecordingSink : public EventSink {
    public:
        void onEvent(const SessionEvent& event) override { events.push_back(event); }

        size_t count(EventType type) const {
            return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                [type](const SessionEvent& e) { return e.type == type; }));
        }

        const SessionEvent* last(EventType type) const {
            for (auto it = events.rbegin(); it != events.rend(); ++it) {
                if (it->type == type) return &*it;
            }
            return nullptr;
        }

        std::vector<SessionEvent> events;
    };

    /** Decode every frame written to a MemoryConnection */
    inline std::vector<Protocol::Frame> writtenFrames(const MemoryConnection& conn) {
        MemoryConnection replay = conn.replayOutput();
        std::vector<Protocol::Frame> frames;
        Protocol::Frame frame;
        while (FrameCodec::readFrame(replay, frame) == Protocol::CodecError::NONE) {
            frames.push_back(frame);
        }
        return frames;
    }

} // namespace test_support

#endif // TEST_SUPPORT_HPP
