#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "connection_registry.hpp"

namespace cpact {

struct ProbeRecord {
    std::string name;
    std::string type;
    bool ok{false};
    std::string detail;
    double elapsed_s{0.0};
};

struct ProbeTally {
    int total{0};
    int ok{0};
};

/**
 * \brief Outcome of probing every configured (target, type) pair.
 *
 * status is SUCCESS when every probe passed, PARTIAL when some did, FAILED when none
 * did and ERROR when nothing could be probed at all.
 */
struct DiscoveryReport {
    std::string status{"ERROR"};
    std::vector<ProbeRecord> records;
    std::map<std::string, ProbeTally> by_type;
    std::map<std::string, ProbeTally> by_name;
    double elapsed_s{0.0};

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Pairs from the config's `connections` x `connection_types`, or every remote target when those are empty.
[[nodiscard]] std::vector<ConnectionRef> configured_pairs(const ConnectionConfig& config);

/// Acquires and probes each pair through \p registry. Failures are recorded, not thrown.
[[nodiscard]] DiscoveryReport discover_connections(ConnectionRegistry& registry, const std::vector<ConnectionRef>& pairs);

}  // namespace cpact
