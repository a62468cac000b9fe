#include "cpact/result_builder.hpp"

#include <algorithm>

namespace {

using nlohmann::json;

cpact::FailureDetail make_detail(const cpact::StepResult& result) {
    return cpact::FailureDetail{
        result.scenario_id,
        result.step_id,
        result.status,
        result.error_kind,
        result.expected,
        result.actual,
        result.connection,
        result.message,
    };
}

void add_diagnostics(json& root, const cpact::ScenarioResult& scenario) {
    json steps = json::object();
    for (const auto& step : scenario.steps) {
        if (step.diagnostic_codes.empty() && step.parameters.empty()) {
            continue;
        }
        json parameters = json::object();
        for (const auto& [name, value] : step.parameters) {
            parameters[name] = value.to_json();
        }
        steps[step.step_id] = json{
            {"step_name", step.step_name},
            {"status", cpact::to_string(step.status)},
            {"codes", step.diagnostic_codes},
            {"parameters", std::move(parameters)},
        };
    }
    if (!steps.empty()) {
        root[scenario.test_id] = std::move(steps);
    }
    for (const auto& child : scenario.nested()) {
        add_diagnostics(root, *child);
    }
}

}  // namespace

namespace cpact {

json Summary::to_json() const {
    json details = json::array();
    for (const auto& detail : failure_details) {
        details.push_back(json{
            {"scenario_id", detail.scenario_id},
            {"step_id", detail.step_id},
            {"status", cpact::to_string(detail.status)},
            {"error_kind", detail.error_kind},
            {"expected", detail.expected},
            {"actual", detail.actual},
            {"connection", detail.connection},
            {"message", detail.message},
        });
    }
    return json{
        {"total", total},
        {"passed", passed},
        {"failed", failed},
        {"skipped", skipped},
        {"errors", errors},
        {"failure_details", std::move(details)},
    };
}

void ResultBuilder::record(const StepResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_locked(result);
}

void ResultBuilder::record_scenario(const ScenarioResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& step : result.steps) {
        record_locked(step);
    }
    if (result.steps.empty() && result.status == StepStatus::error) {
        // scenario never reached its first step (docker pre-step, cycle at the root)
        summary_.failure_details.push_back(
            FailureDetail{result.test_id, {}, StepStatus::error, "scenario", {}, {}, {}, result.message});
    }
    collect_nested_failures(result);
    scenarios_.push_back(result);
}

Summary ResultBuilder::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

std::vector<ScenarioResult> ResultBuilder::scenarios() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scenarios_;
}

StepStatus ResultBuilder::scenario_status(const std::vector<StepResult>& steps) {
    const bool any_failed = std::any_of(steps.begin(), steps.end(), [](const StepResult& step) {
        return step.failed();
    });
    return any_failed ? StepStatus::failed : StepStatus::passed;
}

std::size_t ResultBuilder::export_parameters(const ScenarioResult& child,
                                             ExecutionContext& parent,
                                             const std::vector<std::string>& names) {
    std::size_t exported = 0;
    for (const auto& [name, value] : child.parameters) {
        if (!names.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
            continue;
        }
        parent.set(name, value);
        ++exported;
    }
    return exported;
}

json ResultBuilder::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json scenarios = json::array();
    for (const auto& scenario : scenarios_) {
        scenarios.push_back(json(scenario));
    }
    return json{
        {"summary", summary_.to_json()},
        {"scenarios", std::move(scenarios)},
    };
}

json ResultBuilder::diagnostics_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json root = json::object();
    for (const auto& scenario : scenarios_) {
        add_diagnostics(root, scenario);
    }
    return root;
}

void ResultBuilder::record_locked(const StepResult& result) {
    ++summary_.total;
    switch (result.status) {
    case StepStatus::passed:
        ++summary_.passed;
        break;
    case StepStatus::failed:
        ++summary_.failed;
        break;
    case StepStatus::skipped:
        ++summary_.skipped;
        break;
    case StepStatus::error:
        ++summary_.errors;
        break;
    }
    if (result.failed()) {
        summary_.failure_details.push_back(make_detail(result));
    }
}

void ResultBuilder::collect_nested_failures(const ScenarioResult& result) {
    for (const auto& child : result.nested()) {
        for (const auto& step : child->steps) {
            if (step.failed()) {
                summary_.failure_details.push_back(make_detail(step));
            }
        }
        collect_nested_failures(*child);
    }
}

}  // namespace cpact
