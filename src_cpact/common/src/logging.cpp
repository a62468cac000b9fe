#include "cpact/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char* kLoggerName = "cpact";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

namespace cpact::logging {

void init(const std::string& level, const std::filesystem::path& log_dir) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>((log_dir / "cpact.log").string(),
                                                                            /*truncate*/ false));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_console_logger();
    }
    return g_logger;
}

}  // namespace cpact::logging
