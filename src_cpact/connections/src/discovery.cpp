#include "cpact/discovery.hpp"

#include <chrono>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}  // namespace

namespace cpact {

nlohmann::json DiscoveryReport::to_json() const {
    using nlohmann::json;
    json doc{{"status", status}, {"elapsed_s", elapsed_s}, {"by_type", json::object()}, {"by_name", json::object()},
             {"connections", json::array()}};
    for (const auto& [type, tally] : by_type) {
        doc["by_type"][type] = json{{"total", tally.total}, {"ok", tally.ok}};
    }
    for (const auto& [name, tally] : by_name) {
        doc["by_name"][name] = json{{"total", tally.total}, {"ok", tally.ok}};
    }
    for (const auto& record : records) {
        doc["connections"].push_back(json{{"name", record.name},
                                          {"type", record.type},
                                          {"ok", record.ok},
                                          {"detail", record.detail},
                                          {"elapsed_s", record.elapsed_s}});
    }
    return doc;
}

std::vector<ConnectionRef> configured_pairs(const ConnectionConfig& config) {
    std::vector<ConnectionRef> pairs;
    if (!config.connections.empty() && !config.connection_types.empty()) {
        for (const auto& name : config.connections) {
            for (const auto& type : config.connection_types) {
                pairs.emplace_back(name, type);
            }
        }
        return pairs;
    }
    for (const auto& [name, target] : config.targets) {
        if (!target.is_local()) {
            pairs.emplace_back(name, to_string(target.kind));
        }
    }
    return pairs;
}

DiscoveryReport discover_connections(ConnectionRegistry& registry, const std::vector<ConnectionRef>& pairs) {
    DiscoveryReport report;
    const auto started = Clock::now();

    for (const auto& [name, type] : pairs) {
        ProbeRecord record{name, type};
        const auto probe_start = Clock::now();
        try {
            registry.config().require(name, type);
            auto lease = registry.acquire(name, type);
            std::string diag;
            record.ok = lease.handle().probe(diag);
            record.detail = record.ok ? "ok" : diag;
        } catch (const Error& e) {
            record.detail = e.what();
        }
        record.elapsed_s = seconds_since(probe_start);

        if (record.ok) {
            CPACT_LOG_INFO("[discovery] {} ({}) reachable in {:.2f}s", name, type, record.elapsed_s);
        } else {
            CPACT_LOG_WARN("[discovery] {} ({}) failed: {}", name, type, record.detail);
        }

        auto& by_type = report.by_type[type];
        auto& by_name = report.by_name[name];
        ++by_type.total;
        ++by_name.total;
        if (record.ok) {
            ++by_type.ok;
            ++by_name.ok;
        }
        report.records.push_back(std::move(record));
    }

    std::size_t ok = 0;
    for (const auto& record : report.records) {
        ok += record.ok ? 1 : 0;
    }
    if (report.records.empty()) {
        report.status = "ERROR";
    } else if (ok == report.records.size()) {
        report.status = "SUCCESS";
    } else if (ok > 0) {
        report.status = "PARTIAL";
    } else {
        report.status = "FAILED";
    }
    report.elapsed_s = seconds_since(started);
    return report;
}

}  // namespace cpact
