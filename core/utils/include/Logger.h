#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace CubeLink {

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

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_.load() <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        /**
         * @brief Parse "debug", "info", "warn", "error" or "critical".
         * Unknown names map to INFO.
         */
        static LogLevel parseLevel(const std::string& name);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "CubeLink";
        size_t maxFileSizeMB_ = 50;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
