#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <memory>

namespace FileCourier {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    class Logger {
    public:
        static Logger& instance();

        bool setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setComponent(const std::string& component); // Set default component name
        void setConsoleOutput(bool enabled);

        /**
         * @brief Parse a level name ("debug", "INFO", "warning", ...)
         * @return false if the name is not a known level; level is left untouched
         */
        static bool parseLevel(const std::string& name, LogLevel& level);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        // Helper methods
        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "Courier";
        bool consoleOutput_ = true;

        static std::string levelToString(LogLevel level);
        static std::string getCurrentTime();
    };

}
