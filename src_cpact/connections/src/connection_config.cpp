#include "cpact/connection_config.hpp"

#include <fstream>
#include <optional>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

using nlohmann::json;

constexpr const char* kGlobalSection = "Connection";
constexpr const char* kTunnelSuffix = "Tunnel";

std::optional<std::string> get_string(const json& section, const std::string& key) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::optional<int> get_int(const json& section, const std::string& key, const std::string& where) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        const auto number = cpact::text::parse_number(it->get<std::string>());
        if (number) {
            return static_cast<int>(*number);
        }
    }
    throw cpact::ConfigError("Invalid integer for '" + key + "' in section '" + where + "'");
}

std::optional<bool> get_bool(const json& section, const std::string& key, const std::string& where) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const auto value = cpact::text::parse_boolean(it->get<std::string>());
        if (value) {
            return value;
        }
    }
    throw cpact::ConfigError("Invalid boolean for '" + key + "' in section '" + where + "'");
}

std::vector<std::string> get_list(const json& section, const std::string& key) {
    std::vector<std::string> values;
    const auto it = section.find(key);
    if (it == section.end()) {
        return values;
    }
    if (it->is_string()) {
        return cpact::text::split_list(it->get<std::string>(), ',');
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
    }
    return values;
}

cpact::ConnectionKind parse_kind(const std::string& raw, const std::string& where) {
    const auto lowered = cpact::text::to_lower_copy(raw);
    if (lowered == "local") {
        return cpact::ConnectionKind::local;
    }
    if (lowered == "ssh") {
        return cpact::ConnectionKind::ssh;
    }
    if (lowered == "redfish") {
        return cpact::ConnectionKind::redfish;
    }
    throw cpact::ConfigError("Unknown connection type '" + raw + "' in section '" + where + "'");
}

cpact::ConnectionTarget parse_target(const std::string& name, const json& section, bool use_ssl) {
    cpact::ConnectionTarget target;
    target.name = name;
    target.use_ssl = use_ssl;

    const auto prefix = cpact::text::to_lower_copy(name) + "_";
    if (const auto type = get_string(section, prefix + "connection_type")) {
        target.kind = parse_kind(*type, name);
    } else if (cpact::text::to_lower_copy(name) == cpact::kLocalTarget) {
        target.kind = cpact::ConnectionKind::local;
    } else if (section.contains(prefix + "redfish_port") && !section.contains(prefix + "ssh_port")) {
        target.kind = cpact::ConnectionKind::redfish;
    }

    target.host = get_string(section, prefix + "host").value_or("");
    target.ssh_port = get_int(section, prefix + "ssh_port", name).value_or(22);
    target.redfish_port = get_int(section, prefix + "redfish_port", name).value_or(443);
    target.username = get_string(section, prefix + "username").value_or("");
    target.password = get_string(section, prefix + "password").value_or("");
    target.tunnel = get_bool(section, prefix + "tunnel", name).value_or(false);
    target.auth = get_bool(section, prefix + "auth", name).value_or(!target.is_local());
    target.use_ssl = get_bool(section, prefix + "use_ssl", name).value_or(use_ssl);
    return target;
}

cpact::TunnelSpec parse_tunnel(const std::string& name, const json& section) {
    cpact::TunnelSpec spec;
    const auto prefix = cpact::text::to_lower_copy(name) + "_tunnel_";
    const auto where = name + kTunnelSuffix;
    spec.agent = get_string(section, prefix + "agent").value_or("");
    spec.local_host = get_string(section, prefix + "local_host").value_or("localhost");
    spec.ssh_local_port = get_int(section, prefix + "ssh_local_port", where).value_or(2222);
    spec.redfish_local_port = get_int(section, prefix + "redfish_local_port", where).value_or(8443);
    return spec;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

namespace cpact {

const char* to_string(ConnectionKind kind) noexcept {
    switch (kind) {
    case ConnectionKind::local:
        return "local";
    case ConnectionKind::ssh:
        return "ssh";
    case ConnectionKind::redfish:
        return "redfish";
    }
    return "unknown";
}

int ConnectionTarget::port_for(const std::string& protocol) const {
    const auto lowered = text::to_lower_copy(protocol);
    if (lowered == "redfish") {
        return redfish_port;
    }
    if (lowered == "ssh") {
        return ssh_port;
    }
    return 0;
}

ConnectionConfig ConnectionConfig::parse(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("Connection configuration must be a JSON object");
    }

    ConnectionConfig config;
    if (const auto it = document.find(kGlobalSection); it != document.end() && it->is_object()) {
        config.use_ssl = get_bool(*it, "use_ssl", kGlobalSection).value_or(true);
        config.connections = get_list(*it, "connections");
        config.connection_types = get_list(*it, "connection_types");
    }

    for (const auto& [name, section] : document.items()) {
        if (name == kGlobalSection || !section.is_object() || ends_with(name, kTunnelSuffix)) {
            continue;
        }
        config.targets.emplace(name, parse_target(name, section, config.use_ssl));
    }

    for (auto& [name, target] : config.targets) {
        if (!target.tunnel) {
            continue;
        }
        const auto it = document.find(name + kTunnelSuffix);
        if (it == document.end() || !it->is_object()) {
            throw ConfigError("Target '" + name + "' is tunneled but section '" + name + kTunnelSuffix +
                              "' is missing");
        }
        target.tunnel_spec = parse_tunnel(name, *it);
    }

    if (config.find(kLocalTarget) == nullptr) {
        ConnectionTarget local;
        local.name = kLocalTarget;
        local.kind = ConnectionKind::local;
        local.auth = false;
        config.targets.emplace(local.name, local);
    }

    CPACT_LOG_DEBUG("Parsed {} connection target(s)", config.targets.size());
    return config;
}

ConnectionConfig ConnectionConfig::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw ConfigError("Unable to open connection config: " + file.string());
    }
    const auto document = nlohmann::json::parse(in, nullptr, /*allow_exceptions*/ false);
    if (document.is_discarded()) {
        throw ConfigError("Connection config is not valid JSON: " + file.string());
    }
    return parse(document);
}

const ConnectionTarget* ConnectionConfig::find(const std::string& name) const {
    if (const auto it = targets.find(name); it != targets.end()) {
        return &it->second;
    }
    const auto lowered = text::to_lower_copy(name);
    for (const auto& [key, target] : targets) {
        if (text::to_lower_copy(key) == lowered) {
            return &target;
        }
    }
    return nullptr;
}

void ConnectionConfig::require(const std::string& name, const std::string& protocol) const {
    const auto* target = find(name);
    if (target == nullptr) {
        throw ConfigError("Connection target '" + name + "' is not defined in the connection config");
    }
    if (target->is_local() || text::to_lower_copy(protocol) == "local") {
        return;
    }

    std::vector<std::string> missing;
    if (target->host.empty()) {
        missing.emplace_back("host");
    }
    const int port = target->port_for(protocol);
    if (port <= 0 || port > 65535) {
        missing.emplace_back(protocol + " port");
    }
    if (target->auth) {
        if (target->username.empty()) {
            missing.emplace_back("username");
        }
        if (target->password.empty()) {
            missing.emplace_back("password");
        }
    }
    if (target->tunnel) {
        if (!target->tunnel_spec || target->tunnel_spec->agent.empty()) {
            missing.emplace_back("tunnel agent");
        } else if (const auto* agent = find(target->tunnel_spec->agent); agent != nullptr && agent->tunnel) {
            throw ConfigError("Tunnel agent '" + agent->name + "' of target '" + name +
                              "' must be directly reachable");
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& field : missing) {
            list += list.empty() ? field : ", " + field;
        }
        throw ConfigError("Connection target '" + name + "' is missing mandatory field(s) for " + protocol +
                          ": " + list);
    }
}

}  // namespace cpact
