#include "logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <unordered_map>
#include <vector>

namespace PrimeLab {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::once_flag Logger::init_flag_;
std::mutex Logger::mutex_;

static const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void Logger::install(spdlog::level::level_enum level, const std::string &log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
    }
    auto logger = std::make_shared<spdlog::logger>("primelab", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(LOG_PATTERN);

    spdlog::drop("primelab");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    logger_ = logger;
}

void Logger::init(bool verbose, const std::string &log_file) {
    // Consume the lazy default so getLogger() keeps these sinks; never hold mutex_ across call_once
    std::call_once(init_flag_, [] {});
    std::lock_guard<std::mutex> lock(mutex_);
    install(verbose ? spdlog::level::debug : spdlog::level::info, log_file);
}

void Logger::setLogLevel(const std::string &level) {
    auto logger = getLogger();
    if (logger) logger->set_level(getLogLevel(level));
}

spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
    static const std::unordered_map<std::string, spdlog::level::level_enum> level_map = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
    };
    const auto it = level_map.find(level);
    return it != level_map.end() ? it->second : spdlog::level::info;
}

std::shared_ptr<spdlog::logger> Logger::getLogger() {
    std::call_once(init_flag_, [] {
        std::lock_guard<std::mutex> lock(mutex_);
        install(spdlog::level::info, "");
    });
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_;
}

} // namespace PrimeLab
