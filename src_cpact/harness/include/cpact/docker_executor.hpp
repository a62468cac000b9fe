#pragma once

#include <string>
#include <vector>

#include "cpact/cancellation.hpp"
#include "cpact/connection_registry.hpp"
#include "scenario.hpp"

namespace cpact {

/**
 * \brief Starts and removes the containers a scenario declares under `docker`.
 *
 * Docker commands run through the registry on the container's own connection, so a
 * container may live on the local host or on a remote target. Containers still running
 * when the executor goes away are stopped and removed.
 */
class DockerExecutor {
public:
    explicit DockerExecutor(ConnectionRegistry& registry);
    ~DockerExecutor() { stop_all(); }

    DockerExecutor(const DockerExecutor&) = delete;
    DockerExecutor& operator=(const DockerExecutor&) = delete;

    /// `docker run -dit --name X IMAGE`. Throws the registry's exceptions, or Error when docker reports nothing.
    void start(const ContainerSpec& spec, const CancellationToken* cancel = nullptr);

    /// `docker stop X` then `docker rm X`. Failures are logged; teardown never throws.
    void stop(const ContainerSpec& spec) noexcept;

    /// Starts every container in order; when one fails, the ones already started are stopped.
    void start_all(const std::vector<ContainerSpec>& specs, const CancellationToken* cancel = nullptr);

    /// Stops what start_all() started, in reverse order.
    void stop_all() noexcept;

    [[nodiscard]] const std::vector<ContainerSpec>& running() const noexcept { return running_; }

    /// `docker exec X /bin/bash -c '<command>'`
    [[nodiscard]] static std::string wrap_exec(const std::string& container, const std::string& command);

private:
    ConnectionRegistry& registry_;
    std::vector<ContainerSpec> running_;
};

}  // namespace cpact
