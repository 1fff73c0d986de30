#include "geo_kernel/core/debug.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace geo_kernel {

    namespace {
        const char* LevelTag(LogLevel level) {
            switch (level) {
                case LogLevel::Info:    return "INFO";
                case LogLevel::Success: return "SUCCESS";
                case LogLevel::Warn:    return "WARN";
                case LogLevel::Error:   return "ERROR";
                case LogLevel::Debug:   return "DEBUG";
            }
            return "LOG";
        }

        const char* LevelColor(LogLevel level) {
            switch (level) {
                case LogLevel::Info:    return "\033[37m";
                case LogLevel::Success: return "\033[32m";
                case LogLevel::Warn:    return "\033[33m";
                case LogLevel::Error:   return "\033[31m";
                case LogLevel::Debug:   return "\033[36m";
            }
            return "";
        }

        // Ordem de verbosidade: Debug < Info < Success < Warn < Error
        int Severity(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return 0;
                case LogLevel::Info:    return 1;
                case LogLevel::Success: return 2;
                case LogLevel::Warn:    return 3;
                case LogLevel::Error:   return 4;
            }
            return 4;
        }

        std::string Timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t time = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
#if defined(_WIN32)
            localtime_s(&tm, &time);
#else
            localtime_r(&time, &tm);
#endif
            char buffer[16];
            std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
            return buffer;
        }
    }

    void Debug::SetColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_colorEnabled = enabled;
    }

    void Debug::SetMinimumLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_minLevel = level;
    }

    LogLevel Debug::GetMinimumLevel() {
        std::lock_guard<std::mutex> lock(g_mutex);
        return g_minLevel;
    }

    void Debug::SetAutoFlush(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_autoFlush = enabled;
    }

    void Debug::SetLogFile(const std::string& filepath) {
        auto file = std::make_unique<std::ofstream>(filepath, std::ios::out | std::ios::app);
        if (!file->is_open())
            throw std::runtime_error(fmt::format("Failed to open log file: {}", filepath));

        std::lock_guard<std::mutex> lock(g_mutex);
        g_logFile = std::move(file);
        g_outputStream = g_logFile.get();
    }

    void Debug::SetOutputStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logFile.reset();
        g_outputStream = stream;
    }

    void Debug::ResetOutputToConsole() {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logFile.reset();
        g_outputStream = nullptr;
    }

    bool Debug::IsEnabled(LogLevel level) {
        std::lock_guard<std::mutex> lock(g_mutex);
        return Severity(level) >= Severity(g_minLevel);
    }

    void Debug::Print(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(g_mutex);

        std::ostream& out = g_outputStream ? *g_outputStream : std::cout;
        const bool useColor = g_colorEnabled && g_outputStream == nullptr;

        if (useColor)
            out << LevelColor(level);

        out << '[' << Timestamp() << "] [" << LevelTag(level) << "] " << message;

        if (useColor)
            out << "\033[0m";

        out << '\n';

        if (g_autoFlush)
            out.flush();
    }
} // namespace geo_kernel
