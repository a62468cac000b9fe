/**
 * @file test_connections.cpp
 * @brief Unit Tests for connection config, the connection registry and discovery
 *
 * @author cpact contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 cpact contributors

#include <catch2/catch_test_macros.hpp>
// cpact
#include "cpact/connection.hpp"
#include "cpact/connection_config.hpp"
#include "cpact/connection_registry.hpp"
#include "cpact/discovery.hpp"
#include "cpact/errors.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using cpact::CommandOutput;
using cpact::CommandRequest;
using cpact::ConnectionConfig;
using cpact::ConnectionError;
using cpact::ConnectionFailure;
using cpact::ConnectionHandle;
using cpact::ConnectionRegistry;
using cpact::ConnectionTarget;
using cpact::Endpoint;
using cpact::ExternalConnection;
using cpact::PortForward;

namespace {

nlohmann::json lab_config() {
    return nlohmann::json::parse(R"({
        "Connection": {"use_ssl": false,
                       "connections": ["Inband", "NodeManager"],
                       "connection_types": ["ssh", "redfish"]},
        "Inband": {"inband_host": "10.0.0.5", "inband_username": "root", "inband_password": "pw"},
        "NodeManager": {"nodemanager_host": "10.0.0.9", "nodemanager_redfish_port": 443,
                        "nodemanager_username": "admin", "nodemanager_password": "pw",
                        "nodemanager_tunnel": true},
        "NodeManagerTunnel": {"nodemanager_tunnel_agent": "Inband",
                              "nodemanager_tunnel_ssh_local_port": 2222,
                              "nodemanager_tunnel_redfish_local_port": 8443},
        "Bmc2": {"bmc2_host": "10.0.0.9", "bmc2_redfish_port": 443,
                 "bmc2_username": "admin", "bmc2_password": "pw", "bmc2_tunnel": true},
        "Bmc2Tunnel": {"bmc2_tunnel_agent": "Inband"},
        "Spare": {"spare_host": "10.0.0.7"}
    })");
}

/// Observable state shared by every fake handle of one protocol.
struct FakeBackend {
    int connects{0};
    int disconnects{0};
    bool alive{true};
    bool fail_connect{false};
    int transport_failures{0};  ///< next N execute() calls throw ConnectionError
    ConnectionFailure failure_kind{ConnectionFailure::unreachable};
    std::string reply{"ok\n"};
    std::vector<std::string> commands;
    std::vector<Endpoint> endpoints;
};

ConnectionRegistry::Factory fake_factory(const std::string& protocol, std::shared_ptr<FakeBackend> backend) {
    return [protocol, backend](const ConnectionTarget& target, const Endpoint& endpoint) {
        backend->endpoints.push_back(endpoint);
        ExternalConnection c;
        c.protocol = protocol;
        c.connect = [backend, name = target.name]() {
            if (backend->fail_connect) {
                throw ConnectionError(ConnectionFailure::unreachable, name, "host down");
            }
            ++backend->connects;
        };
        c.execute = [backend, name = target.name](const CommandRequest& request) {
            if (backend->transport_failures > 0) {
                --backend->transport_failures;
                throw ConnectionError(backend->failure_kind, name, "connection reset");
            }
            backend->commands.push_back(request.command);
            CommandOutput out;
            out.text = backend->reply;
            return out;
        };
        c.disconnect = [backend]() { ++backend->disconnects; };
        c.alive = [backend]() { return backend->alive; };
        return ConnectionHandle{std::move(c)};
    };
}

struct OpenerLog {
    int opened{0};
    std::vector<int> remote_ports;
};

ConnectionRegistry::Options fake_tunnels(std::shared_ptr<OpenerLog> log) {
    ConnectionRegistry::Options options;
    options.open_tunnel = [log](const ConnectionTarget&, const ConnectionTarget& agent, int remote_port,
                                int local_port) {
        REQUIRE(agent.name == "Inband");
        ++log->opened;
        log->remote_ports.push_back(remote_port);
        return std::make_shared<PortForward>("localhost", local_port);
    };
    return options;
}

}  // namespace

/* ========================================================================== */
/* CONNECTION CONFIG                                                          */
/* ========================================================================== */

TEST_CASE("Connection config parsing", "[connections][config]") {
    const auto config = ConnectionConfig::parse(lab_config());

    REQUIRE_FALSE(config.use_ssl);
    REQUIRE(config.connections == std::vector<std::string>{"Inband", "NodeManager"});

    const auto* inband = config.find("Inband");
    REQUIRE(inband != nullptr);
    REQUIRE(inband->kind == cpact::ConnectionKind::ssh);
    REQUIRE(inband->ssh_port == 22);
    REQUIRE(inband->auth);

    const auto* nm = config.find("NodeManager");
    REQUIRE(nm != nullptr);
    REQUIRE(nm->kind == cpact::ConnectionKind::redfish);
    REQUIRE(nm->tunnel);
    REQUIRE(nm->tunnel_spec.has_value());
    REQUIRE(nm->tunnel_spec->agent == "Inband");
    REQUIRE(nm->tunnel_spec->local_host == "localhost");
    REQUIRE(nm->tunnel_spec->redfish_local_port == 8443);

    const auto* local = config.find(cpact::kLocalTarget);
    REQUIRE(local != nullptr);
    REQUIRE(local->is_local());
}

TEST_CASE("Connection config requirements per protocol", "[connections][config]") {
    const auto config = ConnectionConfig::parse(lab_config());

    REQUIRE_NOTHROW(config.require("Inband", "ssh"));
    REQUIRE_NOTHROW(config.require("local", "local"));
    REQUIRE_THROWS_AS(config.require("Spare", "ssh"), cpact::ConfigError);  // no credentials
    REQUIRE_THROWS_AS(config.require("Nowhere", "ssh"), cpact::ConfigError);

    auto broken = lab_config();
    broken.erase("NodeManagerTunnel");
    REQUIRE_THROWS_AS(ConnectionConfig::parse(broken), cpact::ConfigError);
    REQUIRE_THROWS_AS(ConnectionConfig::parse(nlohmann::json::array()), cpact::ConfigError);
}

/* ========================================================================== */
/* REGISTRY                                                                   */
/* ========================================================================== */

TEST_CASE("Registry caches one handle per key", "[connections][registry]") {
    auto ssh = std::make_shared<FakeBackend>();
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()), {{"Inband", "ssh"}});

    CommandRequest request;
    request.command = "uname -r";
    REQUIRE(registry.execute("Inband", "ssh", request).text == "ok\n");
    REQUIRE(registry.execute("Inband", "", request).text == "ok\n");  // default kind of Inband is ssh
    REQUIRE(registry.execute("Inband", "SSH", request).text == "ok\n");

    REQUIRE(ssh->connects == 1);
    REQUIRE(registry.connects() == 1);
    REQUIRE(registry.cached_handles() == 1);
    REQUIRE(ssh->commands.size() == 3);
    REQUIRE(ssh->endpoints.size() == 1);
    REQUIRE(ssh->endpoints[0].host == "10.0.0.5");
    REQUIRE(ssh->endpoints[0].port == 22);

    registry.release("Inband", "ssh");
    REQUIRE(registry.cached_handles() == 0);
    REQUIRE(ssh->disconnects == 1);
}

TEST_CASE("Registry rebuilds a stale handle", "[connections][registry]") {
    auto ssh = std::make_shared<FakeBackend>();
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    { auto lease = registry.acquire("Inband", "ssh"); }
    ssh->alive = false;
    {
        auto lease = registry.acquire("Inband", "ssh");
        REQUIRE(lease.key().target == "Inband");
    }
    REQUIRE(ssh->connects == 2);
    REQUIRE(ssh->disconnects == 1);
}

TEST_CASE("Registry retries a transport failure once", "[connections][registry]") {
    auto ssh = std::make_shared<FakeBackend>();
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    CommandRequest request;
    request.command = "true";

    SECTION("one failure is absorbed by a reconnect") {
        ssh->transport_failures = 1;
        REQUIRE(registry.execute("Inband", "ssh", request).text == "ok\n");
        REQUIRE(ssh->connects == 2);
    }

    SECTION("a second failure propagates") {
        ssh->transport_failures = 2;
        REQUIRE_THROWS_AS(registry.execute("Inband", "ssh", request), ConnectionError);
        REQUIRE(ssh->connects == 2);
    }

    SECTION("authentication failures are not retried") {
        ssh->transport_failures = 1;
        ssh->failure_kind = ConnectionFailure::auth_failure;
        try {
            (void)registry.execute("Inband", "ssh", request);
            FAIL("expected ConnectionError");
        } catch (const ConnectionError& e) {
            REQUIRE(e.kind() == ConnectionFailure::auth_failure);
            REQUIRE(e.target() == "Inband");
        }
        REQUIRE(ssh->connects == 1);
    }
}

TEST_CASE("Registry turns error signatures into CommandError", "[connections][registry]") {
    auto ssh = std::make_shared<FakeBackend>();
    ssh->reply = "bash: ipmitool: command not found\n";
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    CommandRequest request;
    request.command = "ipmitool sdr";
    try {
        (void)registry.execute("Inband", "ssh", request);
        FAIL("expected CommandError");
    } catch (const cpact::CommandError& e) {
        REQUIRE(e.signature() == "command not found");
        REQUIRE(e.output() == ssh->reply);
    }
}

TEST_CASE("Registry honours cancellation before sending", "[connections][registry][cancel]") {
    auto ssh = std::make_shared<FakeBackend>();
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    cpact::CancellationToken token;
    token.cancel();
    CommandRequest request;
    request.command = "true";
    request.cancel = &token;
    REQUIRE_THROWS_AS(registry.execute("Inband", "ssh", request), cpact::CancelledError);
    REQUIRE(ssh->commands.empty());
}

TEST_CASE("Registry initialisation checks referenced targets", "[connections][registry][config]") {
    ConnectionRegistry registry;
    const auto config = ConnectionConfig::parse(lab_config());

    REQUIRE_THROWS_AS(registry.initialize(config, {{"Missing", "ssh"}}), cpact::ConfigError);
    REQUIRE_THROWS_AS(registry.initialize(config, {{"Inband", "telnet"}}), cpact::ConfigError);
    REQUIRE_THROWS_AS(registry.initialize(config, {{"Spare", "ssh"}}), cpact::ConfigError);
    REQUIRE_NOTHROW(registry.initialize(config, {{"Inband", "ssh"}, {"local", ""}}));

    // Unreferenced incomplete targets are fine; using them is not.
    REQUIRE_THROWS_AS(registry.acquire("Nowhere", "ssh"), cpact::ConfigError);
}

TEST_CASE("Connection failures are not cached", "[connections][registry]") {
    auto ssh = std::make_shared<FakeBackend>();
    ssh->fail_connect = true;
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    REQUIRE_THROWS_AS(registry.acquire("Inband", "ssh"), ConnectionError);
    REQUIRE(registry.cached_handles() == 0);

    ssh->fail_connect = false;
    REQUIRE_NOTHROW(registry.acquire("Inband", "ssh"));
    REQUIRE(registry.cached_handles() == 1);
}

/* ========================================================================== */
/* TUNNELS                                                                    */
/* ========================================================================== */

TEST_CASE("Tunneled targets share one forward per remote endpoint", "[connections][tunnel]") {
    auto redfish = std::make_shared<FakeBackend>();
    auto opener = std::make_shared<OpenerLog>();
    ConnectionRegistry registry(fake_tunnels(opener));
    registry.register_protocol("redfish", fake_factory("redfish", redfish));
    registry.initialize(ConnectionConfig::parse(lab_config()), {{"NodeManager", "redfish"}, {"Bmc2", "redfish"}});

    {
        auto first = registry.acquire("NodeManager", "redfish");
        REQUIRE(first.handle().tunneled());
        REQUIRE(first.key().topology == "tunnel:Inband@localhost:8443");
        auto second = registry.acquire("Bmc2", "redfish");
        REQUIRE(second.handle().tunneled());
    }

    REQUIRE(opener->opened == 1);
    REQUIRE(opener->remote_ports == std::vector<int>{443});
    REQUIRE(registry.active_tunnels() == 1);
    REQUIRE(registry.cached_handles() == 2);
    for (const auto& endpoint : redfish->endpoints) {
        REQUIRE(endpoint.host == "localhost");
        REQUIRE(endpoint.port == 8443);
    }

    registry.release_all();
    REQUIRE(registry.cached_handles() == 0);
    REQUIRE(registry.active_tunnels() == 0);
}

TEST_CASE("Tunnel setup failure surfaces as ConnectionError", "[connections][tunnel]") {
    ConnectionRegistry::Options options;
    options.open_tunnel = [](const ConnectionTarget& target, const ConnectionTarget&, int, int)
        -> std::shared_ptr<PortForward> {
        throw ConnectionError(ConnectionFailure::tunnel_setup_failure, target.name, "agent refused forward");
    };
    ConnectionRegistry registry(options);
    registry.register_protocol("redfish", fake_factory("redfish", std::make_shared<FakeBackend>()));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    try {
        (void)registry.acquire("NodeManager", "redfish");
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        REQUIRE(e.kind() == ConnectionFailure::tunnel_setup_failure);
        REQUIRE(std::string(cpact::to_string(e.kind())) == "tunnel-setup-failure");
    }
    REQUIRE(registry.cached_handles() == 0);
}

/* ========================================================================== */
/* HEALTH AND DISCOVERY                                                       */
/* ========================================================================== */

TEST_CASE("check_all probes cached handles without reconnecting", "[connections][health]") {
    auto ssh = std::make_shared<FakeBackend>();
    ConnectionRegistry registry;
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    { auto lease = registry.acquire("Inband", "ssh"); }
    ssh->alive = false;
    const auto health = registry.check_all();

    REQUIRE(health.size() == 1);
    REQUIRE_FALSE(health.begin()->second.alive);
    REQUIRE(ssh->connects == 1);
}

TEST_CASE("Discovery probes every configured pair", "[connections][discovery]") {
    auto ssh = std::make_shared<FakeBackend>();
    auto redfish = std::make_shared<FakeBackend>();
    redfish->fail_connect = true;
    auto opener = std::make_shared<OpenerLog>();

    ConnectionRegistry registry(fake_tunnels(opener));
    registry.register_protocol("ssh", fake_factory("ssh", ssh));
    registry.register_protocol("redfish", fake_factory("redfish", redfish));
    registry.initialize(ConnectionConfig::parse(lab_config()));

    const auto pairs = cpact::configured_pairs(registry.config());
    REQUIRE(pairs.size() == 4);

    const auto report = cpact::discover_connections(registry, pairs);
    REQUIRE(report.status == "PARTIAL");
    REQUIRE(report.records.size() == 4);
    REQUIRE(report.by_type.at("ssh").total == 2);
    REQUIRE(report.by_type.at("ssh").ok == 2);
    REQUIRE(report.by_type.at("redfish").ok == 0);
    REQUIRE(report.by_name.at("Inband").ok == 1);

    const auto doc = report.to_json();
    REQUIRE(doc.contains("status"));
}

TEST_CASE("Discovery with nothing to probe is an error", "[connections][discovery]") {
    ConnectionRegistry registry;
    registry.initialize(ConnectionConfig::parse(nlohmann::json::object()));
    const auto report = cpact::discover_connections(registry, cpact::configured_pairs(registry.config()));
    REQUIRE(report.status == "ERROR");
}

TEST_CASE("Error signatures", "[connections][signature]") {
    REQUIRE(cpact::find_error_signature("sh: 1: foo: Permission denied").value() == "permission denied");
    REQUIRE(cpact::find_error_signature(R"({"error": {"code": "Base.1.0.GeneralError", "message": "boom"}})")
                .value() == "redfish error: boom");
    REQUIRE_FALSE(cpact::find_error_signature("all good").has_value());
    REQUIRE_FALSE(cpact::find_error_signature(R"({"error": "plain"})").has_value());
}
