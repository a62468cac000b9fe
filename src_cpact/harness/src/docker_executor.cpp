#include "cpact/docker_executor.hpp"

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

using namespace std::chrono_literals;

constexpr auto kDockerTimeout = 300s;

cpact::CommandRequest docker_request(const std::string& command, const cpact::ContainerSpec& spec,
                                     const cpact::CancellationToken* cancel) {
    cpact::CommandRequest request;
    request.command = command;
    request.use_sudo = spec.use_sudo;
    request.timeout = kDockerTimeout;
    request.cancel = cancel;
    return request;
}

}  // namespace

namespace cpact {

DockerExecutor::DockerExecutor(ConnectionRegistry& registry) : registry_(registry) {}

void DockerExecutor::start(const ContainerSpec& spec, const CancellationToken* cancel) {
    const auto command = "docker run -dit --name " + text::shell_quote(spec.name) + " " + text::shell_quote(spec.image);
    CPACT_LOG_INFO("Starting container {} ({}) on {}", spec.name, spec.image, spec.connection);

    const auto output =
        registry_.execute(spec.connection, spec.connection_type, docker_request(command, spec, cancel));
    const auto container_id = text::trim_copy(output.text);
    if (output.exit_code != 0 || container_id.empty()) {
        throw Error("Failed to start container " + spec.name + ": " + text::trim_copy(output.error_text));
    }
    CPACT_LOG_INFO("Container {} started with id {}", spec.name, container_id.substr(0, 12));
}

void DockerExecutor::stop(const ContainerSpec& spec) noexcept {
    for (const char* verb : {"stop", "rm"}) {
        const auto command = std::string{"docker "} + verb + " " + text::shell_quote(spec.name);
        try {
            const auto output =
                registry_.execute(spec.connection, spec.connection_type, docker_request(command, spec, nullptr));
            if (output.exit_code != 0) {
                CPACT_LOG_WARN("'{}' exited with {}: {}", command, output.exit_code,
                               text::trim_copy(output.error_text));
            }
        } catch (const std::exception& e) {
            CPACT_LOG_WARN("'{}' failed: {}", command, e.what());
        }
    }
    CPACT_LOG_INFO("Container {} stopped and removed", spec.name);
}

void DockerExecutor::start_all(const std::vector<ContainerSpec>& specs, const CancellationToken* cancel) {
    for (const auto& spec : specs) {
        try {
            start(spec, cancel);
        } catch (const std::exception&) {
            // docker run may have created the container before failing
            stop(spec);
            stop_all();
            throw;
        }
        running_.push_back(spec);
    }
}

void DockerExecutor::stop_all() noexcept {
    while (!running_.empty()) {
        stop(running_.back());
        running_.pop_back();
    }
}

std::string DockerExecutor::wrap_exec(const std::string& container, const std::string& command) {
    return "docker exec " + text::shell_quote(container) + " /bin/bash -c " + text::shell_quote(command);
}

}  // namespace cpact
