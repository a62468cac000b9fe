#include "cpact/result.hpp"

namespace {

using nlohmann::json;

json parameters_to_json(const std::map<std::string, cpact::Value>& parameters) {
    json node = json::object();
    for (const auto& [name, value] : parameters) {
        node[name] = value.to_json();
    }
    return node;
}

}  // namespace

namespace cpact {

const char* to_string(StepStatus status) noexcept {
    switch (status) {
    case StepStatus::passed:
        return "passed";
    case StepStatus::failed:
        return "failed";
    case StepStatus::skipped:
        return "skipped";
    case StepStatus::error:
        return "error";
    }
    return "unknown";
}

std::vector<std::shared_ptr<const ScenarioResult>> ScenarioResult::nested() const {
    std::vector<std::shared_ptr<const ScenarioResult>> children;
    for (const auto& step : steps) {
        if (step.nested) {
            children.push_back(step.nested);
        }
    }
    return children;
}

void to_json(nlohmann::json& node, const StepResult& result) {
    node = json{
        {"step_id", result.step_id},
        {"step_name", result.step_name},
        {"step_type", to_string(result.step_type)},
        {"status", to_string(result.status)},
        {"error_kind", result.error_kind},
        {"output", result.output},
        {"elapsed_s", result.elapsed_s},
        {"iterations", result.iterations},
        {"parameters", parameters_to_json(result.parameters)},
        {"diagnostic_codes", result.diagnostic_codes},
        {"result_code", result.result_code ? json(*result.result_code) : json(nullptr)},
        {"expected", result.expected},
        {"actual", result.actual},
        {"connection", result.connection},
        {"message", result.message},
        {"tolerated", result.tolerated},
        {"aborted", result.aborted},
    };
    if (result.nested) {
        node["nested"] = json(*result.nested);
    }
}

void to_json(nlohmann::json& node, const ScenarioResult& result) {
    json steps = json::array();
    for (const auto& step : result.steps) {
        steps.push_back(json(step));
    }
    node = json{
        {"test_id", result.test_id},
        {"test_name", result.test_name},
        {"test_group", result.test_group},
        {"status", to_string(result.status)},
        {"elapsed_s", result.elapsed_s},
        {"message", result.message},
        {"source_file", result.source_file},
        {"parameters", parameters_to_json(result.parameters)},
        {"steps", std::move(steps)},
    };
}

}  // namespace cpact
