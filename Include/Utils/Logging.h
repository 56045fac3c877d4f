/**
 * @file Logging.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Logging utilities
 * @version 0.2
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

#ifndef TAP_ENABLE_LOGGING
#define TAP_ENABLE_LOGGING 1
#endif

#define LOG_DEBUG(fmt, ...) Logger::log(Logger::Level::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(Logger::Level::Info, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(Logger::Level::Warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(Logger::Level::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

class Logger {
public:
    enum class Level : uint8_t {
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_CYAN    = "\033[36m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    static void setLevel(Level level) {
        threshold() = level;
    }

    static Level getLevel() {
        return threshold();
    }

    static void log(Level level, const char* file, int line, const char* fmt, ...) {
#if TAP_ENABLE_LOGGING
        if (static_cast<uint8_t>(level) < static_cast<uint8_t>(threshold())) {
            return;
        }

        // Choose color based on log level
        const char* color = COLOR_RESET;
        const char* name = "DEBUG";
        switch (level) {
            case Level::Error:
                color = COLOR_RED;
                name = "ERROR";
                break;
            case Level::Warn:
                color = COLOR_YELLOW;
                name = "WARN";
                break;
            case Level::Info:
                color = COLOR_GREEN;
                name = "INFO";
                break;
            default:
                color = COLOR_CYAN;
                break;
        }

        // Print colored level with file and line info
        std::printf("%s[%s]%s %s[%s:%d]%s ",
                    color, name, COLOR_RESET,
                    COLOR_GRAY, baseName(file), line, COLOR_RESET);

        va_list args;
        va_start(args, fmt);
        std::vprintf(fmt, args);
        va_end(args);

        std::printf("\n");
#else
        (void)level;
        (void)file;
        (void)line;
        (void)fmt;
#endif
    }

private:
    static Level& threshold() {
        static Level level = Level::Info;
        return level;
    }

    static const char* baseName(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }
};
