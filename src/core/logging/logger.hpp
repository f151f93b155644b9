#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace protoforge::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Mirrors every line (regardless of min level) into a debug log file.
        bool open_debug_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return false;
            }
            debug_file_.open(path, std::ios::app);
            return debug_file_.is_open();
        }

        void close_debug_file() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (debug_file_.is_open()) {
                debug_file_.close();
            }
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);

            const std::string line = "[" + level_to_string(level) + "] " +
                                     (session_id_.empty() ? "" : "[" + session_id_ + "] ") +
                                     message;
            if (debug_file_.is_open()) {
                debug_file_ << line << "\n";
                debug_file_.flush();
            }
            if (level < min_level_) {
                return;
            }
            std::cout << line << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream debug_file_;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) protoforge::core::logging::Logger::get().log(protoforge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  protoforge::core::logging::Logger::get().log(protoforge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  protoforge::core::logging::Logger::get().log(protoforge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) protoforge::core::logging::Logger::get().log(protoforge::core::logging::LogLevel::ERROR, msg)

} // namespace protoforge::core::logging
