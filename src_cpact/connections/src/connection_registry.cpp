#include "cpact/connection_registry.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

constexpr const char* kDirect = "direct";
constexpr int kForwardPortAttempts = 10;
constexpr auto kForwardReadyTimeout = std::chrono::seconds(10);

bool port_accepts(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    if (::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results) != 0) {
        return false;
    }
    bool ok = false;
    for (auto* ai = results; ai != nullptr && !ok; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        ::close(fd);
    }
    ::freeaddrinfo(results);
    return ok;
}

/// Agent that is not a configured target: a bare host reached with the target's credentials.
cpact::ConnectionTarget adhoc_agent(const cpact::ConnectionTarget& target) {
    cpact::ConnectionTarget agent;
    agent.name = target.tunnel_spec->agent;
    agent.host = target.tunnel_spec->agent;
    agent.username = target.username;
    agent.password = target.password;
    return agent;
}

}  // namespace

namespace cpact {

std::shared_ptr<PortForward> open_ssh_forward(const ConnectionTarget& target,
                                              const ConnectionTarget& agent,
                                              int remote_port,
                                              int local_port) {
    const std::string local_host = target.tunnel_spec ? target.tunnel_spec->local_host : std::string{"localhost"};
    std::string diag;

    for (int attempt = 0; attempt < kForwardPortAttempts; ++attempt) {
        const int port = local_port + attempt;
        if (port_accepts(local_host, port)) {
            diag += "local port " + std::to_string(port) + " already in use\n";
            continue;
        }

        std::vector<std::string> argv;
        std::map<std::string, std::string> env;
        if (!agent.password.empty()) {
            argv = {"sshpass", "-e"};
            env["SSHPASS"] = agent.password;
        }
        const std::vector<std::string> ssh = {
            "ssh", "-N",
            "-o", "ExitOnForwardFailure=yes",
            "-o", "StrictHostKeyChecking=no",
            "-o", "UserKnownHostsFile=/dev/null",
            "-o", "ServerAliveInterval=30",
            "-o", "LogLevel=ERROR",
            "-L", local_host + ":" + std::to_string(port) + ":" + target.host + ":" + std::to_string(remote_port),
            "-p", std::to_string(agent.ssh_port),
            agent.username.empty() ? agent.host : agent.username + "@" + agent.host,
        };
        argv.insert(argv.end(), ssh.begin(), ssh.end());

        BackgroundProcess process;
        if (!process.start(argv, env, diag)) {
            break;
        }

        const auto deadline = std::chrono::steady_clock::now() + kForwardReadyTimeout;
        bool ready = false;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!process.running()) {
                break;
            }
            if (port_accepts(local_host, port)) {
                ready = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (ready) {
            CPACT_LOG_INFO("Tunnel {}:{} -> {} -> {}:{} is up", local_host, port, agent.name, target.host,
                           remote_port);
            return std::make_shared<PortForward>(local_host, port, std::move(process));
        }

        const auto err = process.drain_stderr();
        process.stop();
        diag += "port " + std::to_string(port) + ": " + text::trim_copy(err) + "\n";
        if (!text::icontains(err, "address already in use") && !text::icontains(err, "cannot listen")) {
            break;
        }
    }
    throw ConnectionError(ConnectionFailure::tunnel_setup_failure, target.name, text::trim_copy(diag));
}

ConnectionRegistry::ConnectionRegistry() : ConnectionRegistry(Options{}) {}

ConnectionRegistry::ConnectionRegistry(Options options) : options_(std::move(options)) {
    if (!options_.open_tunnel) {
        options_.open_tunnel = open_ssh_forward;
    }
    factories_["local"] = [](const ConnectionTarget&, const Endpoint&) {
        return ConnectionHandle{LocalConnection{}};
    };
    factories_["ssh"] = [](const ConnectionTarget& target, const Endpoint& endpoint) {
        return ConnectionHandle{SshConnection{target, endpoint}};
    };
    factories_["redfish"] = [](const ConnectionTarget& target, const Endpoint& endpoint) {
        return ConnectionHandle{RedfishConnection{target, endpoint}};
    };

    ConnectionTarget local;
    local.name = kLocalTarget;
    local.kind = ConnectionKind::local;
    local.auth = false;
    config_.targets.emplace(local.name, local);
}

ConnectionRegistry::~ConnectionRegistry() {
    release_all();
}

void ConnectionRegistry::register_protocol(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[text::to_lower_copy(name)] = std::move(factory);
}

bool ConnectionRegistry::has_protocol(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(text::to_lower_copy(name)) != 0;
}

void ConnectionRegistry::initialize(ConnectionConfig config, const std::vector<ConnectionRef>& referenced) {
    for (const auto& [name, protocol] : referenced) {
        const auto* target = config.find(name);
        if (target == nullptr) {
            throw ConfigError("Connection target '" + name + "' is referenced but not configured");
        }
        const auto resolved = resolve_protocol(*target, protocol);
        if (!has_protocol(resolved)) {
            throw ConfigError("Connection type '" + resolved + "' of target '" + name + "' is not supported");
        }
        config.require(name, resolved);
        if (target->tunnel && target->tunnel_spec) {
            if (const auto* agent = config.find(target->tunnel_spec->agent); agent != nullptr) {
                config.require(agent->name, "ssh");
            }
        }
    }
    release_all();
    config_ = std::move(config);
    CPACT_LOG_INFO("Connection registry initialised with {} target(s), {} referenced", config_.targets.size(),
                   referenced.size());
}

std::string ConnectionRegistry::resolve_protocol(const ConnectionTarget& target, const std::string& protocol) const {
    const auto lowered = text::to_lower_copy(text::trim_copy(protocol));
    if (!lowered.empty()) {
        return lowered;
    }
    return to_string(target.kind);
}

const ConnectionTarget& ConnectionRegistry::lookup(const std::string& name) const {
    const auto* target = config_.find(name);
    if (target == nullptr) {
        throw ConfigError("Connection target '" + name + "' is not configured");
    }
    return *target;
}

CacheKey ConnectionRegistry::make_key(const ConnectionTarget& target, const std::string& protocol) const {
    CacheKey key{target.name, protocol, kDirect};
    if (target.tunnel && target.tunnel_spec && protocol != "local") {
        const auto& spec = *target.tunnel_spec;
        const int local_port = protocol == "redfish" ? spec.redfish_local_port : spec.ssh_local_port;
        key.topology = "tunnel:" + spec.agent + "@" + spec.local_host + ":" + std::to_string(local_port);
    }
    return key;
}

std::shared_ptr<PortForward> ConnectionRegistry::tunnel_for(const ConnectionTarget& target, const std::string& protocol) {
    if (!target.tunnel_spec || target.tunnel_spec->agent.empty()) {
        throw ConnectionError(ConnectionFailure::tunnel_setup_failure, target.name, "no tunnel agent configured");
    }
    const auto& spec = *target.tunnel_spec;
    const int remote_port = target.port_for(protocol);
    const int local_port = protocol == "redfish" ? spec.redfish_local_port : spec.ssh_local_port;
    const auto tunnel_key = spec.agent + ">" + target.host + ":" + std::to_string(remote_port);

    std::lock_guard<std::mutex> lock(tunnel_mutex_);
    if (auto it = tunnels_.find(tunnel_key); it != tunnels_.end()) {
        if (auto forward = it->second.lock(); forward && forward->alive()) {
            CPACT_LOG_DEBUG("Reusing tunnel {} on local port {}", tunnel_key, forward->local_port());
            return forward;
        }
        tunnels_.erase(it);
    }

    const auto* configured_agent = config_.find(spec.agent);
    const ConnectionTarget agent = configured_agent != nullptr ? *configured_agent : adhoc_agent(target);
    auto forward = options_.open_tunnel(target, agent, remote_port, local_port);
    if (!forward) {
        throw ConnectionError(ConnectionFailure::tunnel_setup_failure, target.name, "tunnel opener returned nothing");
    }
    tunnels_[tunnel_key] = forward;
    return forward;
}

void ConnectionRegistry::establish(detail::CacheEntry& entry, const ConnectionTarget& target) {
    const auto& protocol = entry.key.protocol;
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = factories_.find(protocol);
        if (it == factories_.end()) {
            throw ConfigError("Connection type '" + protocol + "' is not supported");
        }
        factory = it->second;
    }

    if (entry.key.topology == kDirect) {
        entry.handle.emplace(factory(target, Endpoint{target.host, target.port_for(protocol)}));
    } else {
        auto forward = tunnel_for(target, protocol);
        auto inner = std::make_unique<ConnectionHandle>(
            factory(target, Endpoint{forward->local_host(), forward->local_port()}));
        entry.handle.emplace(TunnelConnection{std::move(forward), std::move(inner)});
    }

    try {
        entry.handle->connect();
    } catch (...) {
        entry.handle.reset();
        throw;
    }
    ++connects_;
    CPACT_LOG_INFO("Connected {}", entry.key.str());
}

ConnectionLease ConnectionRegistry::acquire(const std::string& target_name, const std::string& protocol_name) {
    const auto& target = lookup(target_name);
    const auto protocol = resolve_protocol(target, protocol_name);
    const auto key = make_key(target, protocol);

    std::shared_ptr<detail::CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (factories_.count(protocol) == 0) {
            throw ConfigError("Connection type '" + protocol + "' of target '" + target.name + "' is not supported");
        }
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_shared<detail::CacheEntry>(key);
        }
        entry = slot;
    }

    std::unique_lock<std::mutex> entry_lock(entry->mutex);
    if (entry->handle && entry->handle->alive()) {
        return ConnectionLease{entry, std::move(entry_lock)};
    }
    if (entry->handle) {
        CPACT_LOG_WARN("Handle {} is stale, reconnecting", key.str());
        entry->handle->disconnect();
        entry->handle.reset();
    }
    try {
        establish(*entry, target);
    } catch (const Error&) {
        forget(entry);
        throw;
    }
    return ConnectionLease{entry, std::move(entry_lock)};
}

void ConnectionRegistry::forget(const std::shared_ptr<detail::CacheEntry>& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(entry->key);
    if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
    }
}

CommandOutput ConnectionRegistry::execute(ConnectionLease& lease, const CommandRequest& request) {
    if (request.cancel != nullptr && request.cancel->cancelled()) {
        throw CancelledError("Request on " + lease.key().str() + " cancelled before start");
    }

    CommandOutput out;
    for (int attempt = 0;; ++attempt) {
        try {
            out = lease.handle().execute(request);
            break;
        } catch (const ConnectionError& e) {
            const bool cancelled = request.cancel != nullptr && request.cancel->cancelled();
            if (attempt > 0 || cancelled || e.kind() == ConnectionFailure::auth_failure) {
                throw;
            }
            CPACT_LOG_WARN("{}; re-establishing {} once", e.what(), lease.key().str());
            auto& entry = *lease.entry_;
            entry.handle->disconnect();
            entry.handle.reset();
            try {
                establish(entry, lookup(entry.key.target));
            } catch (const Error&) {
                forget(lease.entry_);
                throw;
            }
        }
    }

    if (auto signature = find_error_signature(out.text + "\n" + out.error_text)) {
        throw CommandError(*signature, out.text.empty() ? out.error_text : out.text);
    }
    return out;
}

CommandOutput ConnectionRegistry::execute(const std::string& target,
                                          const std::string& protocol,
                                          const CommandRequest& request) {
    auto lease = acquire(target, protocol);
    return execute(lease, request);
}

std::map<std::string, ConnectionHealth> ConnectionRegistry::check_all() {
    std::vector<std::shared_ptr<detail::CacheEntry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::map<std::string, ConnectionHealth> health;
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ConnectionHealth status;
        if (!entry->handle) {
            status.detail = "not connected";
        } else {
            std::string diag;
            status.alive = entry->handle->alive() && entry->handle->probe(diag);
            status.detail = status.alive ? "ok" : text::trim_copy(diag);
        }
        health[entry->key.str()] = status;
    }
    return health;
}

void ConnectionRegistry::release(const std::string& target_name, const std::string& protocol_name) {
    const auto* target = config_.find(target_name);
    if (target == nullptr) {
        return;
    }
    const auto key = make_key(*target, resolve_protocol(*target, protocol_name));

    std::shared_ptr<detail::CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return;
        }
        entry = it->second;
        entries_.erase(it);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->handle) {
        entry->handle->disconnect();
        entry->handle.reset();
        CPACT_LOG_DEBUG("Released {}", key.str());
    }
}

void ConnectionRegistry::release_all() {
    std::map<CacheKey, std::shared_ptr<detail::CacheEntry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }
    for (auto& [key, entry] : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->handle) {
            entry->handle->disconnect();
            entry->handle.reset();
        }
    }
    if (!entries.empty()) {
        CPACT_LOG_DEBUG("Released {} cached handle(s)", entries.size());
    }
}

std::size_t ConnectionRegistry::cached_handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t ConnectionRegistry::active_tunnels() const {
    std::lock_guard<std::mutex> lock(tunnel_mutex_);
    std::size_t count = 0;
    for (const auto& [key, forward] : tunnels_) {
        count += forward.expired() ? 0 : 1;
    }
    return count;
}

}  // namespace cpact
