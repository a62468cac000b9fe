#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cpact {

inline constexpr const char* kLocalTarget = "local";

enum class ConnectionKind {
    local,
    ssh,
    redfish,
};

[[nodiscard]] const char* to_string(ConnectionKind kind) noexcept;

/**
 * \brief Port-forward settings for a target reached through an intermediate agent.
 */
struct TunnelSpec {
    std::string agent;                   ///< Name of another target, or a bare host name
    std::string local_host{"localhost"};
    int ssh_local_port{2222};
    int redfish_local_port{8443};
};

/**
 * \brief One logical connection target (e.g. "NodeManager") as read from the config file.
 *
 * Immutable once loaded. A target may be reached over several protocols; \c kind is the
 * protocol used when a step does not name one.
 */
struct ConnectionTarget {
    std::string name;
    ConnectionKind kind{ConnectionKind::ssh};
    std::string host;
    int ssh_port{22};
    int redfish_port{443};
    std::string username;
    std::string password;
    bool tunnel{false};
    bool auth{true};
    bool use_ssl{true};
    std::optional<TunnelSpec> tunnel_spec;

    [[nodiscard]] bool is_local() const noexcept { return kind == ConnectionKind::local; }
    [[nodiscard]] int port_for(const std::string& protocol) const;
};

/**
 * \brief Parsed connection configuration.
 *
 * Sections are keyed by target name. Keys inside a section use the lower-cased target
 * name as prefix:
 *
 * \code{.json}
 * "NodeManager": {
 *     "nodemanager_host": "10.0.0.5",
 *     "nodemanager_redfish_port": 443,
 *     "nodemanager_username": "admin",
 *     "nodemanager_password": "secret",
 *     "nodemanager_tunnel": true
 * },
 * "NodeManagerTunnel": {
 *     "nodemanager_tunnel_agent": "Inband",
 *     "nodemanager_tunnel_ssh_local_port": 2222
 * }
 * \endcode
 *
 * The `Connection` section carries global settings (`use_ssl`, `connections`,
 * `connection_types`). A target named `local` is always present.
 */
struct ConnectionConfig {
    bool use_ssl{true};
    std::vector<std::string> connections;
    std::vector<std::string> connection_types;
    std::map<std::string, ConnectionTarget> targets;

    [[nodiscard]] static ConnectionConfig parse(const nlohmann::json& document);
    [[nodiscard]] static ConnectionConfig load(const std::filesystem::path& file);

    [[nodiscard]] const ConnectionTarget* find(const std::string& name) const;

    /// Throws ConfigError when \p name is unknown or lacks the fields \p protocol needs.
    void require(const std::string& name, const std::string& protocol) const;
};

}  // namespace cpact
