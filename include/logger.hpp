#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace PrimeLab {

class Logger {
public:
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    // Colour stdout sink, plus a file sink when log_file is non-empty
    static void init(bool verbose, const std::string &log_file = "");

    template <typename... Args>
    static void log(spdlog::level::level_enum level, const char *file, int line, const char *func,
                    const char *fmt, Args &&...args);

    static void setLogLevel(const std::string &level);
    static spdlog::level::level_enum getLogLevel(const std::string &level);
    static std::shared_ptr<spdlog::logger> getLogger();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::once_flag init_flag_;
    static std::mutex mutex_;

    static void install(spdlog::level::level_enum level, const std::string &log_file);
};

#define LOG_(level, fmt, ...) \
    PrimeLab::Logger::log(level, __FILE__, __LINE__, __FUNCTION__, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_(spdlog::level::err, fmt, ##__VA_ARGS__)

template <typename... Args>
void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func,
                 const char *fmt, Args &&...args) {
    auto logger = getLogger();
    if (!logger) {
        std::cerr << "Logger not initialized!" << std::endl;
        return;
    }
    spdlog::source_loc source{file, line, func};
    if constexpr (sizeof...(args) > 0) {
        const std::string msg = fmt::vformat(fmt, fmt::make_format_args(args...));
        logger->log(source, level, spdlog::string_view_t(msg));
    } else {
        logger->log(source, level, spdlog::string_view_t(fmt));
    }
}

} // namespace PrimeLab
