#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "cpact/cancellation.hpp"
#include "connection_config.hpp"
#include "subprocess.hpp"

namespace cpact {

/// Where a handle actually connects: the target itself or the local end of a forward.
struct Endpoint {
    std::string host;
    int port{0};
};

struct CommandRequest {
    std::string command;                          ///< shell command, or Redfish resource path
    std::string method{"GET"};                    ///< Redfish only
    std::string body;                             ///< Redfish only, JSON
    std::map<std::string, std::string> headers;   ///< Redfish only
    bool use_sudo{false};
    std::chrono::milliseconds timeout{0};         ///< 0 means no deadline
    const CancellationToken* cancel{nullptr};
};

struct CommandOutput {
    std::string text;        ///< stdout, or the Redfish response body
    std::string error_text;  ///< stderr
    int exit_code{0};        ///< process exit code, or HTTP status for Redfish
    double elapsed_s{0.0};
};

/**
 * \brief Returns the first recognised failure signature found in \p output.
 *
 * Matching is case-insensitive and independent of the exit code.
 */
[[nodiscard]] std::optional<std::string> find_error_signature(const std::string& output);

/**
 * \brief Local end of an SSH port forward. The forwarding process stops with the object.
 */
class PortForward {
public:
    PortForward(std::string local_host, int local_port);
    PortForward(std::string local_host, int local_port, BackgroundProcess process);

    PortForward(const PortForward&) = delete;
    PortForward& operator=(const PortForward&) = delete;

    [[nodiscard]] const std::string& local_host() const noexcept { return local_host_; }
    [[nodiscard]] int local_port() const noexcept { return local_port_; }
    [[nodiscard]] bool alive();

private:
    std::string local_host_;
    int local_port_;
    bool managed_;
    BackgroundProcess process_;
};

class ConnectionHandle;

class LocalConnection {
public:
    void connect();
    [[nodiscard]] CommandOutput execute(const CommandRequest& request);
    void disconnect();
    [[nodiscard]] bool alive() const noexcept { return connected_; }
    [[nodiscard]] bool probe(std::string& diag);

private:
    bool connected_{false};
};

/**
 * \brief SSH access through the system `ssh` client.
 *
 * Password authentication goes through `sshpass -e`; without a password the client runs
 * in batch mode and relies on keys. ssh's own exit status 255 is treated as a transport
 * failure.
 */
class SshConnection {
public:
    SshConnection(ConnectionTarget target, Endpoint endpoint);

    void connect();
    [[nodiscard]] CommandOutput execute(const CommandRequest& request);
    void disconnect();
    [[nodiscard]] bool alive() const noexcept { return connected_; }
    [[nodiscard]] bool probe(std::string& diag);

private:
    [[nodiscard]] ProcessSpec make_spec(const std::string& remote_command) const;

    ConnectionTarget target_;
    Endpoint endpoint_;
    bool connected_{false};
};

/**
 * \brief Redfish REST access through the system `curl` client.
 *
 * The response status is appended by curl's write-out and split off again, so
 * CommandOutput::exit_code carries the HTTP status.
 */
class RedfishConnection {
public:
    RedfishConnection(ConnectionTarget target, Endpoint endpoint);

    void connect();
    [[nodiscard]] CommandOutput execute(const CommandRequest& request);
    void disconnect();
    [[nodiscard]] bool alive() const noexcept { return connected_; }
    [[nodiscard]] bool probe(std::string& diag);

private:
    [[nodiscard]] std::string base_url() const;

    ConnectionTarget target_;
    Endpoint endpoint_;
    bool connected_{false};
};

/// Wraps an SSH or Redfish handle that talks to the local end of a shared port forward.
class TunnelConnection {
public:
    TunnelConnection(std::shared_ptr<PortForward> forward, std::unique_ptr<ConnectionHandle> inner);
    ~TunnelConnection();
    TunnelConnection(TunnelConnection&&) noexcept;
    TunnelConnection& operator=(TunnelConnection&&) noexcept;

    void connect();
    [[nodiscard]] CommandOutput execute(const CommandRequest& request);
    void disconnect();
    [[nodiscard]] bool alive() const;
    [[nodiscard]] bool probe(std::string& diag);

    [[nodiscard]] const std::shared_ptr<PortForward>& forward() const noexcept { return forward_; }

private:
    std::shared_ptr<PortForward> forward_;
    std::unique_ptr<ConnectionHandle> inner_;
};

/// Handle assembled from callables, for protocols registered outside this library.
struct ExternalConnection {
    std::string protocol;
    std::function<void()> connect;
    std::function<CommandOutput(const CommandRequest&)> execute;
    std::function<void()> disconnect;
    std::function<bool()> alive;
};

/**
 * \brief A live connection: one of the closed set of transports behind one interface.
 *
 * connect() throws ConnectionError; execute() throws ConnectionError on transport
 * failures, TimeoutError when the request deadline passes and CancelledError when the
 * request's cancellation token fires.
 */
class ConnectionHandle {
public:
    using Variant = std::variant<LocalConnection, SshConnection, RedfishConnection, TunnelConnection, ExternalConnection>;

    explicit ConnectionHandle(Variant impl);

    void connect();
    [[nodiscard]] CommandOutput execute(const CommandRequest& request);
    void disconnect();
    [[nodiscard]] bool alive() const;

    /// Liveness round trip. Does not change the connected state.
    [[nodiscard]] bool probe(std::string& diag);

    [[nodiscard]] std::string protocol() const;
    [[nodiscard]] bool tunneled() const noexcept { return std::holds_alternative<TunnelConnection>(impl_); }

private:
    Variant impl_;
};

}  // namespace cpact
