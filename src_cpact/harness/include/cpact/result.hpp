#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scenario.hpp"
#include "value.hpp"

namespace cpact {

enum class StepStatus {
    passed,
    failed,
    skipped,
    error,
};

[[nodiscard]] const char* to_string(StepStatus status) noexcept;

struct ScenarioResult;

/**
 * \brief Outcome of one step.
 *
 * \c error_kind is empty for passed steps and names the cause otherwise, for example
 * `validation_mismatch`, `command_error`, `connection:unreachable`, `timeout`,
 * `cancelled`, `cycle`, `expression`, `entry_criteria` or `aborted`.
 */
struct StepResult {
    std::string scenario_id;
    std::string step_id;
    std::string step_name;
    StepType step_type{StepType::command_execution};
    StepStatus status{StepStatus::skipped};
    std::string error_kind;

    std::string output;
    double elapsed_s{0.0};
    int iterations{0};
    std::map<std::string, Value> parameters;  ///< set by output/diagnostic analysis
    std::vector<std::string> diagnostic_codes;
    std::optional<std::string> result_code;

    std::string expected;
    std::string actual;
    std::string connection;  ///< "<target>/<protocol>", empty when none was used
    std::string message;

    bool tolerated{false};  ///< failed, but `continue: true` let the scenario go on
    bool aborted{false};    ///< skipped because an earlier step ended the scenario

    std::shared_ptr<const ScenarioResult> nested;  ///< invoke_scenario only

    [[nodiscard]] bool failed() const noexcept {
        return status == StepStatus::failed || status == StepStatus::error;
    }
};

struct ScenarioResult {
    std::string test_id;
    std::string test_name;
    std::string test_group;
    StepStatus status{StepStatus::passed};  ///< passed, failed or error
    std::vector<StepResult> steps;
    double elapsed_s{0.0};
    std::string message;
    std::string source_file;

    /// Parameters written by this scenario's own steps.
    std::map<std::string, Value> parameters;

    /// Results of invoke_scenario steps, in step order.
    [[nodiscard]] std::vector<std::shared_ptr<const ScenarioResult>> nested() const;
};

void to_json(nlohmann::json& node, const StepResult& result);
void to_json(nlohmann::json& node, const ScenarioResult& result);

}  // namespace cpact
