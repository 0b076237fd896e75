#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <atomic>
#include <memory>
#include <string>

namespace NoxJail {

// Process-wide logger. Everything goes to stderr (and optionally a rotating
// file) so that log output never mixes with captured command output.
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    // An empty path keeps logging on stderr only.
    void initialize(const std::string& logFilePath = std::string(),
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    // Accepts spdlog level names ("trace", "debug", "info", "warning", ...).
    static Level levelFromString(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        current()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        current()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        current()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        current()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        current()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        current()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();

    // initialize() may swap the logger while other threads are logging.
    std::shared_ptr<spdlog::logger> current() const { return std::atomic_load(&logger_); }
    void replace(std::shared_ptr<spdlog::logger> logger) { std::atomic_store(&logger_, std::move(logger)); }

    std::shared_ptr<spdlog::logger> logger_;
};

#define NOXJAIL_TRACE(...) NoxJail::Logger::instance().trace(__VA_ARGS__)
#define NOXJAIL_DEBUG(...) NoxJail::Logger::instance().debug(__VA_ARGS__)
#define NOXJAIL_INFO(...) NoxJail::Logger::instance().info(__VA_ARGS__)
#define NOXJAIL_WARN(...) NoxJail::Logger::instance().warn(__VA_ARGS__)
#define NOXJAIL_ERROR(...) NoxJail::Logger::instance().error(__VA_ARGS__)
#define NOXJAIL_CRITICAL(...) NoxJail::Logger::instance().critical(__VA_ARGS__)

} // namespace NoxJail
