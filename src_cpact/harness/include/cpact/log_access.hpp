#pragma once

#include <filesystem>
#include <string>

#include "cpact/connection_registry.hpp"

namespace cpact {

inline constexpr const char* kCurrentLogDir = "current_log_dir";

/**
 * \brief Reads the text a log_analysis step inspects.
 *
 * Paths starting with `current_log_dir` name files of this run and resolve to
 * `<log_dir>/command_outputs`. Other paths are read from the local file system when the
 * step targets `local`, and fetched through the step's connection otherwise (`cat` over
 * SSH, a GET of the resource path over Redfish).
 */
class LogAccess {
public:
    LogAccess(ConnectionRegistry* registry, std::filesystem::path log_dir);

    [[nodiscard]] std::filesystem::path command_output_dir() const { return log_dir_ / "command_outputs"; }

    /// Maps a `current_log_dir/...` path into this run's output directory; other paths unchanged.
    [[nodiscard]] std::filesystem::path resolve(const std::string& log_path) const;

    /**
     * \brief Returns the content of \p log_path.
     *
     * Throws CommandError when the file does not exist or cannot be read, and the
     * registry's exceptions for remote fetches.
     */
    [[nodiscard]] std::string read(const std::string& log_path,
                                   const std::string& target,
                                   const std::string& protocol,
                                   const CommandRequest& base_request) const;

private:
    ConnectionRegistry* registry_;
    std::filesystem::path log_dir_;
};

}  // namespace cpact
