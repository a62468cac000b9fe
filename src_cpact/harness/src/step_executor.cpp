#include "cpact/step_executor.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <set>

#include <boost/regex.hpp>

#include "cpact/analyzer.hpp"
#include "cpact/docker_executor.hpp"
#include "cpact/errors.hpp"
#include "cpact/expression.hpp"
#include "cpact/log_access.hpp"
#include "cpact/logging.hpp"
#include "cpact/result_builder.hpp"
#include "cpact/scenario_loader.hpp"
#include "cpact/text.hpp"

namespace {

using namespace std::chrono_literals;
using cpact::StepExecutor;

double seconds_since(StepExecutor::Clock::time_point start) {
    return std::chrono::duration<double>(StepExecutor::Clock::now() - start).count();
}

std::chrono::milliseconds time_left(const std::optional<StepExecutor::Clock::time_point>& deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - StepExecutor::Clock::now());
    if (left <= 0ms) {
        throw cpact::TimeoutError("step exceeded its duration");
    }
    return left;
}

bool write_output_file(const std::filesystem::path& destination, const std::string& content, std::string& diag) {
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        diag = "cannot create " + destination.parent_path().string() + ": " + ec.message();
        return false;
    }
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        diag = "cannot open " + destination.string();
        return false;
    }
    output << content;
    if (!output) {
        diag = "write to " + destination.string() + " failed";
        return false;
    }
    return true;
}

struct RedfishCall {
    std::string method;
    std::string path;
    std::string body;
};

/// "PATCH /redfish/v1/Systems/1 {...}" or a bare resource path.
RedfishCall parse_redfish_command(const std::string& command, const std::string& method, const std::string& body) {
    static const std::set<std::string> kVerbs = {"GET", "POST", "PUT", "PATCH", "DELETE"};
    RedfishCall call{method.empty() ? "GET" : cpact::text::trim_copy(method), cpact::text::trim_copy(command), body};

    const auto space = call.path.find_first_of(cpact::text::kWhitespace);
    if (space == std::string::npos) {
        return call;
    }
    const auto verb = call.path.substr(0, space);
    std::string upper;
    for (const char ch : verb) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    if (kVerbs.count(upper) == 0) {
        return call;
    }
    auto rest = cpact::text::trim_copy(std::string_view{call.path}.substr(space));
    call.method = upper;
    const auto split = rest.find_first_of(cpact::text::kWhitespace);
    if (split == std::string::npos) {
        call.path = rest;
    } else {
        call.path = rest.substr(0, split);
        if (call.body.empty()) {
            call.body = cpact::text::trim_copy(std::string_view{rest}.substr(split));
        }
    }
    return call;
}

void set_parameters(const std::map<std::string, cpact::Value>& parameters, cpact::ExecutionContext& context,
                    cpact::StepResult& result) {
    for (const auto& [name, value] : parameters) {
        context.set(name, value);
        result.parameters[name] = value;
    }
}

void fail(cpact::StepResult& result, cpact::StepStatus status, std::string error_kind, std::string message) {
    result.status = status;
    result.error_kind = std::move(error_kind);
    result.message = std::move(message);
}

}  // namespace

namespace cpact {

StepExecutor::StepExecutor(Config config) : config_(std::move(config)) {
    if (!config_.cancel) {
        config_.cancel = std::make_shared<CancellationToken>();
    }
    if (!config_.read_log) {
        config_.read_log = [registry = config_.registry, log_dir = config_.log_dir](
                               const StepDefinition& step, const CommandRequest& base_request) {
            return LogAccess(registry, log_dir).read(step.log_path, step.connection, step.connection_type,
                                                     base_request);
        };
    }
}

std::filesystem::path StepExecutor::output_file(const ScenarioDefinition& scenario, const StepDefinition& step) const {
    static const boost::regex kNonWord(R"(\W+)");
    const auto step_name = boost::regex_replace(step.step_name, kNonWord, "_");
    return config_.log_dir / "command_outputs" / (scenario.test_id + "_" + step.step_id + "_" + step_name + ".txt");
}

StepResult StepExecutor::execute(const StepDefinition& step,
                                 const ScenarioDefinition& scenario,
                                 ExecutionContext& context,
                                 InvocationStack& stack) const {
    StepResult result;
    result.scenario_id = scenario.test_id;
    result.step_id = step.step_id;
    result.step_name = step.step_name;
    result.step_type = step.step_type;

    const auto started = Clock::now();
    Deadline deadline = stack.deadline();
    if (step.duration) {
        const auto own =
            started + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(*step.duration));
        if (!deadline || own < *deadline) {
            deadline = own;
        }
    }

    const auto gate = evaluate_entry_criteria(step.entry_criteria, context);
    if (!gate.pass) {
        fail(result, StepStatus::skipped, gate.errored ? "expression" : "entry_criteria", gate.detail);
        CPACT_LOG_INFO("[{}] step {} '{}' skipped: {}", scenario.test_id, step.step_id, step.step_name, gate.detail);
        return result;
    }

    CPACT_LOG_INFO("[{}] step {} '{}' ({}) running", scenario.test_id, step.step_id, step.step_name,
                   to_string(step.step_type));
    result.status = StepStatus::passed;
    try {
        check_cancelled();
        switch (step.step_type) {
        case StepType::command_execution:
            run_command(step, scenario, context, result, deadline);
            break;
        case StepType::log_analysis:
            run_log_analysis(step, scenario, context, result, deadline);
            break;
        case StepType::invoke_scenario:
            run_invoke(step, scenario, context, stack, result, deadline);
            break;
        }
        if (deadline && Clock::now() > *deadline && !result.failed()) {
            throw TimeoutError(step.duration && seconds_since(started) > *step.duration
                                   ? "step exceeded its duration of " + Value{*step.duration}.to_string() + "s"
                                   : std::string{"duration of the invoking step expired"});
        }
    } catch (const TimeoutError& e) {
        fail(result, StepStatus::error, "timeout", e.what());
    } catch (const CancelledError& e) {
        fail(result, StepStatus::error, "cancelled", e.what());
    } catch (const ConnectionError& e) {
        fail(result, StepStatus::error, std::string{"connection:"} + to_string(e.kind()), e.what());
        if (result.connection.empty()) {
            result.connection = e.target();
        }
    } catch (const CommandError& e) {
        fail(result, StepStatus::failed, "command_error", e.what());
        result.actual = e.output();
    } catch (const CycleError& e) {
        fail(result, StepStatus::failed, "cycle", e.what());
    } catch (const ConfigError& e) {
        fail(result, StepStatus::error, "config", e.what());
    } catch (const ExpressionError& e) {
        fail(result, StepStatus::error, "expression", e.what());
    } catch (const std::exception& e) {
        fail(result, StepStatus::error, "internal", e.what());
    }

    result.elapsed_s = seconds_since(started);
    if (result.failed() && step.continue_on_failure) {
        result.tolerated = true;
    }

    if (result.failed()) {
        CPACT_LOG_ERROR("[{}] step {} '{}' {} ({}): {}{}", scenario.test_id, step.step_id, step.step_name,
                        to_string(result.status), result.error_kind, result.message,
                        result.tolerated ? " [continue]" : "");
    } else {
        CPACT_LOG_INFO("[{}] step {} '{}' {} in {:.3f}s", scenario.test_id, step.step_id, step.step_name,
                       to_string(result.status), result.elapsed_s);
    }
    return result;
}

void StepExecutor::run_command(const StepDefinition& step,
                               const ScenarioDefinition& scenario,
                               ExecutionContext& context,
                               StepResult& result,
                               const Deadline& deadline) const {
    if (config_.registry == nullptr) {
        throw ConfigError("No connection registry configured for step " + step.step_id);
    }

    auto lease = config_.registry->acquire(step.connection, step.connection_type);
    result.connection = lease.key().target + "/" + lease.key().protocol;

    auto request = base_request(step, deadline);
    if (lease.key().protocol == "redfish") {
        const auto call = parse_redfish_command(step.command, step.method, step.body);
        request.command = call.path;
        request.method = call.method;
        request.body = call.body;
    } else {
        request.command =
            step.container_name.empty() ? step.command : DockerExecutor::wrap_exec(step.container_name, step.command);
    }

    CommandOutput output;
    for (int iteration = 1; iteration <= step.loop; ++iteration) {
        if (iteration > 1) {
            const auto gate = evaluate_entry_criteria(step.entry_criteria, context);
            if (!gate.pass) {
                CPACT_LOG_INFO("[{}] step {} loop stopped after {} iteration(s): {}", scenario.test_id,
                               step.step_id, result.iterations, gate.detail);
                break;
            }
        }
        check_cancelled();
        if (deadline) {
            request.timeout = time_left(deadline);
        }
        CPACT_LOG_DEBUG("[{}] step {} iteration {}/{}: {}", scenario.test_id, step.step_id, iteration, step.loop,
                        request.command);
        output = config_.registry->execute(lease, request);
        ++result.iterations;
        set_parameters(analysis::analyze_output(output.text, step.output_analysis), context, result);
    }

    result.output = output.text;
    if (config_.persist_outputs && !config_.log_dir.empty()) {
        const auto destination = output_file(scenario, step);
        std::string diag;
        if (!write_output_file(destination, output.text, diag)) {
            CPACT_LOG_WARN("[{}] step {} output not saved: {}", scenario.test_id, step.step_id, diag);
        }
    }

    const bool http = lease.key().protocol == "redfish";
    const bool status_failed = http ? output.exit_code >= 400 : output.exit_code != 0;
    if (status_failed) {
        fail(result, StepStatus::failed, "exit_status",
             std::string{http ? "HTTP status " : "exit code "} + std::to_string(output.exit_code) +
                 (output.error_text.empty() ? std::string{} : ": " + text::trim_copy(output.error_text)));
        result.actual = output.text;
        return;
    }

    check_expected(step, scenario, result);
    if (!step.diagnostic_analysis.empty()) {
        apply_diagnostics(step, output.text, context, result);
    }
}

void StepExecutor::run_log_analysis(const StepDefinition& step,
                                    const ScenarioDefinition& scenario,
                                    ExecutionContext& context,
                                    StepResult& result,
                                    const Deadline& deadline) const {
    if (!step.connection.empty() && step.connection != kLocalTarget) {
        result.connection = step.connection + "/" + (step.connection_type.empty() ? "ssh" : step.connection_type);
    }
    const auto log_text = config_.read_log(step, base_request(step, deadline));
    result.output = log_text;
    CPACT_LOG_DEBUG("[{}] step {} read {} byte(s) from {}", scenario.test_id, step.step_id, log_text.size(),
                    step.log_path);

    apply_diagnostics(step, log_text, context, result);
    if (!result.failed()) {
        check_expected(step, scenario, result);
    }
}

void StepExecutor::run_invoke(const StepDefinition& step,
                              const ScenarioDefinition& scenario,
                              ExecutionContext& context,
                              InvocationStack& stack,
                              StepResult& result,
                              const Deadline& deadline) const {
    if (!config_.resolve_scenario || !config_.run_scenario) {
        throw ConfigError("Scenario invocation is not available for step " + step.step_id);
    }
    const auto child = config_.resolve_scenario(step.scenario_path, scenario);
    if (stack.contains(child->test_id)) {
        throw CycleError(child->test_id, stack.chain());
    }

    CPACT_LOG_INFO("[{}] step {} invokes scenario {}", scenario.test_id, step.step_id, child->test_id);
    std::shared_ptr<ScenarioResult> child_result;
    {
        const InvocationStack::DeadlineScope bounded(stack, deadline);
        child_result = std::make_shared<ScenarioResult>(config_.run_scenario(*child, context, stack));
    }
    result.nested = child_result;
    result.message = "invoked " + child->test_id + ": " + to_string(child_result->status);
    if (deadline && Clock::now() >= *deadline) {
        throw TimeoutError("invoked scenario " + child->test_id + " outlived the step's duration");
    }

    if (step.export_parameters) {
        const auto& names = *step.export_parameters;
        for (const auto& [name, value] : child_result->parameters) {
            if (names.empty() || std::find(names.begin(), names.end(), name) != names.end()) {
                result.parameters[name] = value;
            }
        }
        const auto exported = ResultBuilder::export_parameters(*child_result, context, names);
        CPACT_LOG_DEBUG("[{}] step {} exported {} parameter(s)", scenario.test_id, step.step_id, exported);
    }

    if (child_result->status != StepStatus::passed) {
        fail(result, StepStatus::failed, "nested_failure",
             "invoked scenario " + child->test_id + " " + to_string(child_result->status) +
                 (child_result->message.empty() ? std::string{} : ": " + child_result->message));
    }
}

void StepExecutor::check_expected(const StepDefinition& step,
                                  const ScenarioDefinition& scenario,
                                  StepResult& result) const {
    std::optional<std::string> expected = step.expected_output;
    if (!expected && !step.expected_output_path.empty()) {
        auto path = LogAccess(nullptr, config_.log_dir).resolve(step.expected_output_path);
        if (path.is_relative() && !scenario.source_file.empty()) {
            const auto beside = scenario.source_file.parent_path() / path;
            if (std::filesystem::exists(beside)) {
                path = beside;
            }
        }
        expected = read_text_file(path);
    }
    if (!expected) {
        return;
    }

    const auto validation = analysis::validate(result.output, step.validator_type, *expected);
    if (!validation.ok) {
        fail(result, StepStatus::failed, "validation_mismatch", validation.detail);
        result.expected = *expected;
        result.actual = result.output;
    }
}

void StepExecutor::apply_diagnostics(const StepDefinition& step,
                                     const std::string& subject,
                                     ExecutionContext& context,
                                     StepResult& result) const {
    const auto outcome = analysis::analyze_diagnostics(subject, step.diagnostic_analysis);
    set_parameters(outcome.parameters, context, result);
    result.diagnostic_codes.insert(result.diagnostic_codes.end(), outcome.codes.begin(), outcome.codes.end());
    if (outcome.result_code) {
        result.result_code = outcome.result_code;
    }
    if (outcome.failed) {
        std::string codes;
        for (const auto& code : outcome.codes) {
            codes += codes.empty() ? code : ", " + code;
        }
        fail(result, StepStatus::failed, "diagnostic", "diagnostic code(s) matched: " + codes);
    }
}

CommandRequest StepExecutor::base_request(const StepDefinition& step, const Deadline& deadline) const {
    CommandRequest request;
    request.use_sudo = step.use_sudo;
    request.timeout = deadline ? time_left(deadline) : config_.command_timeout;
    request.cancel = config_.cancel.get();
    return request;
}

void StepExecutor::check_cancelled() const {
    if (config_.cancel->cancelled()) {
        throw CancelledError("run cancelled");
    }
}

}  // namespace cpact
