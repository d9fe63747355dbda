#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <expected>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

/**
 * Process-wide logger: console and/or one size-capped file.
 *
 * The LOG_* macros test the level before any argument is formatted, so a
 * disabled LOG_DEBUG costs one atomic load. Never pass passwords, password
 * hashes, session tokens or key material.
 */
class Logger
{
public:
    enum class Level : uint8_t { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    [[nodiscard]] static Level level() { return instance().lvl.load(std::memory_order_relaxed); }
    [[nodiscard]] static bool enabled(Level l) { return level() <= l; }
    static Level parse_level(std::string_view lvl);

    template<typename... Args>
    static void write(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        log_msg(l, std::format(fmt, std::forward<Args>(args)...));
    }

private:
    struct State
    {
        std::atomic<Level> lvl{Level::Info};
        std::mutex mtx;
        std::ofstream file;
        std::string filename;
        bool console = true;
        size_t max_size = 100 * 1024 * 1024;
        size_t written = 0;
    };

    static State& instance();
    static std::string_view level_str(Level l);
    static std::string timestamp();
    static void rotate(State& s);
    static void log_msg(Level l, const std::string& msg);
};

#define DNDSERVER_LOG(lvl, ...)                         \
    do                                                  \
    {                                                   \
        if (Logger::enabled(lvl))                       \
        {                                               \
            Logger::write(lvl, __VA_ARGS__);            \
        }                                               \
    } while (false)

#define LOG_DEBUG(...) DNDSERVER_LOG(Logger::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...)  DNDSERVER_LOG(Logger::Level::Info, __VA_ARGS__)
#define LOG_WARN(...)  DNDSERVER_LOG(Logger::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) DNDSERVER_LOG(Logger::Level::Error, __VA_ARGS__)
