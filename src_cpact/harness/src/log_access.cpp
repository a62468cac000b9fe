#include "cpact/log_access.hpp"

#include <fstream>
#include <sstream>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

std::string read_local(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw cpact::CommandError("no such file or directory", file.string());
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw cpact::CommandError("permission denied", file.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

namespace cpact {

LogAccess::LogAccess(ConnectionRegistry* registry, std::filesystem::path log_dir)
    : registry_(registry), log_dir_(std::move(log_dir)) {}

std::filesystem::path LogAccess::resolve(const std::string& log_path) const {
    const std::string prefix = kCurrentLogDir;
    if (log_path == prefix) {
        return command_output_dir();
    }
    if (log_path.rfind(prefix + "/", 0) == 0) {
        return command_output_dir() / log_path.substr(prefix.size() + 1);
    }
    return log_path;
}

std::string LogAccess::read(const std::string& log_path,
                            const std::string& target,
                            const std::string& protocol,
                            const CommandRequest& base_request) const {
    const auto resolved = resolve(log_path);
    const bool run_local = resolved.string() != log_path || target.empty() || target == kLocalTarget ||
                           registry_ == nullptr;
    if (run_local) {
        CPACT_LOG_DEBUG("Reading log {}", resolved.string());
        return read_local(resolved);
    }

    CommandRequest request = base_request;
    const auto lowered = text::to_lower_copy(protocol);
    if (lowered == "redfish") {
        request.command = log_path;
        request.method = "GET";
    } else {
        request.command = "cat " + text::shell_quote(log_path);
    }
    CPACT_LOG_DEBUG("Fetching log {} from {} over {}", log_path, target, protocol.empty() ? "default" : protocol);
    return registry_->execute(target, protocol, request).text;
}

}  // namespace cpact
