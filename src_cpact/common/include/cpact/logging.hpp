#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cpact::logging {

/**
 * \brief Installs the process-wide "cpact" logger.
 *
 * A colour console sink is always attached. When \p log_dir is non-empty a file sink
 * writing `<log_dir>/cpact.log` is added as well. \p level accepts the spdlog level
 * names (trace, debug, info, warn, error, critical, off).
 */
void init(const std::string& level, const std::filesystem::path& log_dir = {});

/// Returns the engine logger, creating a console-only one on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

}  // namespace cpact::logging

#define CPACT_LOG_DEBUG(...) ::cpact::logging::get()->debug(__VA_ARGS__)
#define CPACT_LOG_INFO(...) ::cpact::logging::get()->info(__VA_ARGS__)
#define CPACT_LOG_WARN(...) ::cpact::logging::get()->warn(__VA_ARGS__)
#define CPACT_LOG_ERROR(...) ::cpact::logging::get()->error(__VA_ARGS__)
