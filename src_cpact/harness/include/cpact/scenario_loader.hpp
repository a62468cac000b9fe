#pragma once

#include "scenario.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cpact {

/**
 * \brief Scenario selection from the command line. Empty fields select everything.
 *
 * - \c test_id: exact match.
 * - \c test_name: case-insensitive substring.
 * - \c test_group: exact match.
 * - \c tags: at least one tag in common.
 */
struct ScenarioFilter {
    std::string test_id;
    std::string test_name;
    std::string test_group;
    std::vector<std::string> tags;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bool matches(const ScenarioDefinition& scenario) const;
};

/**
 * \brief Reads scenario documents from disk.
 *
 * Documents are YAML (`.yaml`, `.yml`) or JSON (`.json`) with a `test_scenario` root:
 *
 * \code{.yaml}
 * test_scenario:
 *   test_id: "T-001"
 *   test_name: "CPU temperature"
 *   test_group: "thermal"
 *   tags: ["cpu", "smoke"]
 *   test_steps:
 *     - step_id: 1
 *       step_name: read temperature
 *       step_type: command_execution
 *       connection: Inband
 *       connection_type: ssh
 *       step_command: "sensors | grep Package"
 *       output_analysis:
 *         - regex: 'temp=(\d+)'
 *           parameter_to_set: temp
 *     - step_id: 2
 *       step_type: log_analysis
 *       entry_criteria: ["temp > 80"]
 *       log_analysis_path: current_log_dir/T-001_1_read_temperature.txt
 *       diagnostic_analysis:
 *         - search_string: "throttled"
 *           diagnostic_result_code: "THERMAL-01"
 * \endcode
 *
 * The loader performs the semantic checks (unique step ids, payload per step type,
 * known validator types, declared containers). Schema validation happens in SchemaGate.
 */
class ScenarioLoader {
public:
    ScenarioLoader() = default;

    /// Reads and converts a document to JSON. Throws ConfigError when unreadable or malformed.
    [[nodiscard]] nlohmann::json read_document(const std::filesystem::path& file) const;

    /// Converts already-read \p content, choosing YAML or JSON by the extension of \p file.
    [[nodiscard]] nlohmann::json parse_text(const std::string& content, const std::filesystem::path& file) const;

    /// Builds the definition. Throws SchemaError listing every semantic problem.
    [[nodiscard]] ScenarioDefinition parse(const nlohmann::json& document, const std::filesystem::path& source) const;

    /// read_document() + parse(), fingerprint included.
    [[nodiscard]] ScenarioDefinition load(const std::filesystem::path& file) const;

    /// Scenario documents under \p root, recursively, sorted. A file root is returned as is.
    [[nodiscard]] std::vector<std::filesystem::path> discover(const std::filesystem::path& root) const;

    /// Indentation-based scan for keys repeated within one YAML mapping; one message per duplicate.
    [[nodiscard]] static std::vector<std::string> scan_duplicate_keys(const std::string& yaml_text);

    /// FNV-1a 64 over \p bytes.
    [[nodiscard]] static std::uint64_t fingerprint(std::string_view bytes) noexcept;

    [[nodiscard]] static bool is_scenario_file(const std::filesystem::path& file);
};

/// Reads a whole file; throws ConfigError when it cannot be opened.
[[nodiscard]] std::string read_text_file(const std::filesystem::path& file);

}  // namespace cpact
