#pragma once

#include <atomic>
#include <compare>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "connection.hpp"
#include "connection_config.hpp"

namespace cpact {

/// Identity of a cached handle: (target name, protocol, tunnel topology).
struct CacheKey {
    std::string target;
    std::string protocol;
    std::string topology;  ///< "direct" or "tunnel:<agent>@<local host>:<local port>"

    auto operator<=>(const CacheKey&) const = default;

    [[nodiscard]] std::string str() const { return target + "/" + protocol + "/" + topology; }
};

struct ConnectionHealth {
    bool alive{false};
    std::string detail;
};

/// (target, protocol) pair named by a scenario step.
using ConnectionRef = std::pair<std::string, std::string>;

namespace detail {

struct CacheEntry {
    explicit CacheEntry(CacheKey k) : key(std::move(k)) {}

    CacheKey key;
    std::mutex mutex;
    std::optional<ConnectionHandle> handle;
};

}  // namespace detail

/**
 * \brief Exclusive, scoped access to one cached handle.
 *
 * Holding a lease holds the per-key lock: a second acquire() of the same key blocks until
 * the lease is destroyed. Leases must not outlive the registry.
 */
class ConnectionLease {
public:
    ConnectionLease(ConnectionLease&&) noexcept = default;
    ConnectionLease& operator=(ConnectionLease&&) = delete;

    [[nodiscard]] ConnectionHandle& handle() { return *entry_->handle; }
    [[nodiscard]] const CacheKey& key() const noexcept { return entry_->key; }

private:
    friend class ConnectionRegistry;

    ConnectionLease(std::shared_ptr<detail::CacheEntry> entry, std::unique_lock<std::mutex> lock)
        : entry_(std::move(entry)), lock_(std::move(lock)) {}

    std::shared_ptr<detail::CacheEntry> entry_;
    std::unique_lock<std::mutex> lock_;
};

/**
 * \brief Creates, caches, health-checks and tears down connection handles.
 *
 * Handles are cached per CacheKey and reused while they pass the liveness check. A
 * stale handle is dropped and rebuilt once per call; there is no other retry. Tunneled
 * targets share one port forward per (agent, remote host, remote port); the forward is
 * torn down when the last handle using it goes away.
 *
 * Thread-safe. Operations on different keys proceed in parallel, operations on the same
 * key are serialised.
 */
class ConnectionRegistry {
public:
    using Factory = std::function<ConnectionHandle(const ConnectionTarget&, const Endpoint&)>;
    using TunnelOpener = std::function<std::shared_ptr<PortForward>(
        const ConnectionTarget& target, const ConnectionTarget& agent, int remote_port, int local_port)>;

    struct Options {
        TunnelOpener open_tunnel{};  ///< defaults to open_ssh_forward()
    };

    ConnectionRegistry();
    explicit ConnectionRegistry(Options options);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Maps a protocol name to a handle constructor. Replaces an existing registration.
    void register_protocol(const std::string& name, Factory factory);
    [[nodiscard]] bool has_protocol(const std::string& name) const;

    /**
     * \brief Installs the target definitions.
     *
     * Every (target, protocol) in \p referenced is checked for its mandatory fields;
     * the first problem raises ConfigError. Unreferenced targets may stay incomplete.
     */
    void initialize(ConnectionConfig config, const std::vector<ConnectionRef>& referenced = {});

    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }

    /// Empty \p protocol selects the target's default kind. Throws ConfigError or ConnectionError.
    [[nodiscard]] ConnectionLease acquire(const std::string& target, const std::string& protocol);

    /**
     * \brief Runs \p request on the leased handle.
     *
     * Throws TimeoutError, CancelledError, ConnectionError (after one reconnect attempt)
     * and CommandError when the output carries a recognised error signature.
     */
    [[nodiscard]] CommandOutput execute(ConnectionLease& lease, const CommandRequest& request);

    [[nodiscard]] CommandOutput execute(const std::string& target,
                                        const std::string& protocol,
                                        const CommandRequest& request);

    /// Probes every cached handle. Does not connect, evict or reconnect anything.
    [[nodiscard]] std::map<std::string, ConnectionHealth> check_all();

    void release(const std::string& target, const std::string& protocol);
    void release_all();

    [[nodiscard]] std::size_t cached_handles() const;
    [[nodiscard]] std::size_t active_tunnels() const;
    [[nodiscard]] std::size_t connects() const noexcept { return connects_.load(); }

    /// Normalised protocol name: lower case, empty resolved to the target's default kind.
    [[nodiscard]] std::string resolve_protocol(const ConnectionTarget& target, const std::string& protocol) const;

private:
    [[nodiscard]] const ConnectionTarget& lookup(const std::string& name) const;
    [[nodiscard]] CacheKey make_key(const ConnectionTarget& target, const std::string& protocol) const;
    void establish(detail::CacheEntry& entry, const ConnectionTarget& target);
    void forget(const std::shared_ptr<detail::CacheEntry>& entry);
    [[nodiscard]] std::shared_ptr<PortForward> tunnel_for(const ConnectionTarget& target, const std::string& protocol);

    Options options_;
    ConnectionConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
    std::map<CacheKey, std::shared_ptr<detail::CacheEntry>> entries_;

    mutable std::mutex tunnel_mutex_;
    std::map<std::string, std::weak_ptr<PortForward>> tunnels_;

    std::atomic<std::size_t> connects_{0};
};

/**
 * \brief Opens `ssh -N -L` from the tunnel's local end through \p agent to \p target.
 *
 * Starting at \p local_port, up to ten consecutive local ports are tried when the port is
 * already taken. Throws ConnectionError(tunnel_setup_failure).
 */
[[nodiscard]] std::shared_ptr<PortForward> open_ssh_forward(const ConnectionTarget& target,
                                                            const ConnectionTarget& agent,
                                                            int remote_port,
                                                            int local_port);

}  // namespace cpact
