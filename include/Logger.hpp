#include <string>
#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "SessionEvent.hpp"

class Logger : public EventSink {
    public:
        Logger(std::string clientID, std::string logFile = "logs/server.log", bool echo = true);
        ~Logger() override = default;
        void onEvent(const SessionEvent& event) override; //Format and record a session event
        void logConnectionOpened(const std::string& peer); //Log connection opening
        void logConnectionClosed(const std::string& peer); //Log connection closure
        void logClientCount(int count); //Log number of connected clients
        void logCustomMsg(const std::string& entry); //Log custom message
        static std::string describe(const SessionEvent& event); //Event text without timestamp/client prefix
    private:
        std::string clientID;
        std::string logFile;
        bool echo;
        const std::string getTime();
        void write(const std::string& entry);
        void writeAs(const std::string& source, const std::string& entry);
        void logToFile(const std::string& entry);
};

#endif // LOGGER_HPP
