#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "context.hpp"
#include "result.hpp"

namespace cpact {

/// Everything needed to report a failing step without re-running it.
struct FailureDetail {
    std::string scenario_id;
    std::string step_id;
    StepStatus status{StepStatus::failed};
    std::string error_kind;
    std::string expected;
    std::string actual;
    std::string connection;
    std::string message;
};

struct Summary {
    std::size_t total{0};
    std::size_t passed{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t errors{0};
    std::vector<FailureDetail> failure_details;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * \brief Aggregates step and scenario results of a run.
 *
 * Totals count steps. Steps of invoked sub-scenarios are not counted again; their
 * failures appear in the failure details under the sub-scenario id. Safe to call from
 * several worker threads.
 */
class ResultBuilder {
public:
    void record(const StepResult& result);

    /// Records every step of \p result and keeps the scenario for the report.
    void record_scenario(const ScenarioResult& result);

    [[nodiscard]] Summary summary() const;
    [[nodiscard]] std::vector<ScenarioResult> scenarios() const;

    /// `failed` when any step failed or errored; skipped steps never count.
    [[nodiscard]] static StepStatus scenario_status(const std::vector<StepResult>& steps);

    /**
     * \brief Copies parameters set by an invoked scenario into \p parent.
     *
     * With an empty \p names every parameter of \p child is exported, otherwise only the
     * listed ones that exist. Returns the number of parameters written.
     */
    static std::size_t export_parameters(const ScenarioResult& child,
                                         ExecutionContext& parent,
                                         const std::vector<std::string>& names = {});

    /// Summary plus every recorded scenario.
    [[nodiscard]] nlohmann::json to_json() const;

    /// scenario id -> step id -> diagnostic codes and analysis parameters.
    [[nodiscard]] nlohmann::json diagnostics_json() const;

private:
    void record_locked(const StepResult& result);
    void collect_nested_failures(const ScenarioResult& result);

    mutable std::mutex mutex_;
    Summary summary_;
    std::vector<ScenarioResult> scenarios_;
};

}  // namespace cpact
