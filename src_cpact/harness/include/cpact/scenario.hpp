#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cpact {

enum class StepType {
    command_execution,
    log_analysis,
    invoke_scenario,
};

[[nodiscard]] const char* to_string(StepType type) noexcept;
[[nodiscard]] std::optional<StepType> parse_step_type(const std::string& raw);

/**
 * \brief `output_analysis` entry: binds \c parameter to what \c regex captures.
 */
struct OutputRule {
    std::string regex;
    std::string parameter;
};

/**
 * \brief `diagnostic_analysis` entry.
 *
 * Two shapes exist. A code rule has \c search_string and \c result_code (and may set a
 * boolean \c parameter recording whether it matched). An extraction rule has
 * \c diagnostic_search_string and a mandatory \c parameter.
 */
struct DiagnosticRule {
    std::string search_string;
    std::string diagnostic_search_string;
    std::string result_code;
    std::string parameter;
    bool terminal{false};     ///< stop evaluating further rules once this one matches
    std::string severity{"failure"};  ///< "failure" or "info"; only code rules use it
};

/**
 * \brief Container started before the steps run and removed afterwards.
 */
struct ContainerSpec {
    std::string name;
    std::string image;
    std::string connection{"local"};
    std::string connection_type{"local"};
    bool use_sudo{false};
};

/**
 * \brief One step of a scenario, immutable once loaded.
 */
struct StepDefinition {
    std::string step_id;
    std::string step_name;
    StepType step_type{StepType::command_execution};
    std::string connection;
    std::string connection_type;

    std::string command;         ///< step_command
    std::string method;          ///< Redfish verb, GET when empty
    std::string body;            ///< Redfish request body
    std::string log_path;        ///< log_analysis_path
    std::string scenario_path;   ///< invoke_scenario target

    std::string validator_type;  ///< json, text, regex, text_regex or exact; empty means text
    std::optional<std::string> expected_output;
    std::string expected_output_path;

    std::vector<std::string> entry_criteria;
    std::vector<OutputRule> output_analysis;
    std::vector<DiagnosticRule> diagnostic_analysis;

    int loop{1};
    std::optional<double> duration;  ///< seconds
    bool continue_on_failure{false};
    bool use_sudo{false};
    std::string container_name;

    /// invoke_scenario: parameters copied back into the caller. Empty list means all of them.
    std::optional<std::vector<std::string>> export_parameters;
};

/**
 * \brief A validated, parsed scenario document.
 */
struct ScenarioDefinition {
    std::string test_id;
    std::string test_name;
    std::string test_group;
    std::vector<std::string> tags;
    std::string description;
    std::vector<ContainerSpec> containers;
    std::vector<StepDefinition> steps;

    std::filesystem::path source_file{};
    std::uint64_t fingerprint{0};
};

}  // namespace cpact
