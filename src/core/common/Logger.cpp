#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <vector>

namespace NoxJail {

namespace {
constexpr const char* kLoggerName = "noxjail";
constexpr const char* kConsolePattern = "[%H:%M:%S] [%^%l%$] [%t] %v";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Usable before initialize(); stderr only.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    logger->set_level(spdlog::level::info);
    replace(std::move(logger));
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(kConsolePattern);

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (!logFilePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(static_cast<spdlog::level::level_enum>(level));

        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger);
        replace(logger);

        if (logFilePath.empty()) {
            NOXJAIL_INFO("Logger initialized (stderr only)");
        } else {
            NOXJAIL_INFO("Logger initialized with file: {}", logFilePath);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        auto fallback = std::make_shared<spdlog::logger>(
            "noxjail_fallback", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        fallback->error("Logger initialization failed: {}", ex.what());
        replace(std::move(fallback));
    }
}

void Logger::setLevel(Level level) {
    current()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::level() const {
    return static_cast<Level>(current()->level());
}

Logger::Level Logger::levelFromString(const std::string& name) {
    const auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off) {
        return Level::Info;
    }
    return static_cast<Level>(parsed);
}

} // namespace NoxJail
