#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>
#include <system_error>
#include <utility>

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;

// Sanitize a log line (keep printable ASCII/tab, cap length). File names come from clients.
static std::string sanitize_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        else
            out.push_back('?');
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given client
Logger::Logger(std::string clientID, std::string logFile, bool echo)
    : clientID{std::move(clientID)}, logFile{std::move(logFile)}, echo{echo} {
    // Ensure the log directory exists (safe if it already exists)
    std::filesystem::path parent = std::filesystem::path(this->logFile).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[Logger] ERROR: cannot create " << parent << ": " << ec.message() << "\n";
        }
    }
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

std::string Logger::describe(const SessionEvent& event){
    const char* status = Protocol::statusCodeName(event.status);
    switch (event.type) {
        case EventType::SESSION_OPENED:
            return "Session opened";
        case EventType::COMMAND_RECEIVED:
            return fmt::format("Received request '{}'", event.command);
        case EventType::COMMAND_REJECTED:
            return fmt::format("Rejected request '{}': {} ({})", event.command, status, event.detail);
        case EventType::TRANSFER_STARTED:
            return fmt::format("Transfer started for '{}': {}", event.command, event.detail);
        case EventType::TRANSFER_COMPLETED:
            return fmt::format("Transfer completed for '{}': {} bytes", event.command, event.count);
        case EventType::TRANSFER_FAILED:
            return fmt::format("Transfer failed for '{}' after {} bytes: {} ({})",
                               event.command, event.count, status, event.detail);
        case EventType::LISTING_PRODUCED:
            return fmt::format("Sent list containing {} entries", event.count);
        case EventType::PROTOCOL_ERROR:
            return fmt::format("Protocol error, closing connection: {}", event.detail);
        case EventType::SESSION_CLOSED:
            return fmt::format("Session closed ({})", event.detail);
    }
    return event.detail;
}

void Logger::onEvent(const SessionEvent& event){
    // Session lines are tagged with the peer they belong to
    writeAs(event.peer.empty() ? clientID : event.peer, describe(event));
}

void Logger::logConnectionOpened(const std::string& peer){
    write("Connection opened from " + peer);
}
void Logger::logConnectionClosed(const std::string& peer){
    write("Connection closed for " + peer);
}
void Logger::logClientCount(int count){
    write(fmt::format("Clients connected: {}", count));
}
void Logger::logCustomMsg(const std::string& entry){
    write(entry);
}

void Logger::write(const std::string& entry){
    writeAs(clientID, entry);
}

void Logger::writeAs(const std::string& source, const std::string& entry){
    std::string log = getTime() + " [" + sanitize_line(source) + "]: " + sanitize_line(entry);
    if (echo) {
        std::lock_guard<std::mutex> lock(g_log_file_mutex);
        std::cout << log << std::endl;
    }
    logToFile(log);
}


void Logger::logToFile(const std::string& entry){
    // One log file shared by every session; appends are serialized
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    std::ofstream out(logFile, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << logFile << "\n";
        return;
    }
    out << entry << '\n';
}
