#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "cpact/cancellation.hpp"
#include "cpact/connection_registry.hpp"
#include "context.hpp"
#include "result.hpp"
#include "scenario.hpp"

namespace cpact {

/**
 * \brief Runs one step: gate, execute, validate, analyse, update the context.
 *
 * A step goes PENDING -> GATING -> SKIPPED, or -> RUNNING -> PASSED / FAILED / ERROR.
 * Exceptions raised by a step become the StepResult's status and error kind; anything
 * derived from std::exception that cpact does not classify is recorded as `internal`.
 */
class StepExecutor {
public:
    using Clock = std::chrono::steady_clock;

    /// Text of a log_analysis source for \p step.
    using LogReader = std::function<std::string(const StepDefinition& step, const CommandRequest& base_request)>;

    /// Parsed scenario named by an invoke_scenario step of \p caller.
    using ScenarioResolver =
        std::function<std::shared_ptr<const ScenarioDefinition>(const std::string& scenario_path,
                                                                const ScenarioDefinition& caller)>;

    /// Runs a child scenario on top of \p parent. Throws CycleError when it is already on \p stack.
    using ScenarioRunner = std::function<ScenarioResult(const ScenarioDefinition& scenario,
                                                        const ExecutionContext& parent,
                                                        InvocationStack& stack)>;

    struct Config {
        ConnectionRegistry* registry{nullptr};
        std::filesystem::path log_dir{};
        bool persist_outputs{true};
        std::chrono::milliseconds command_timeout{0};  ///< per command when the step has no duration; 0 = none
        std::shared_ptr<CancellationToken> cancel{};
        LogReader read_log{};                           ///< defaults to LogAccess on log_dir
        ScenarioResolver resolve_scenario{};
        ScenarioRunner run_scenario{};
    };

    explicit StepExecutor(Config config);

    [[nodiscard]] StepResult execute(const StepDefinition& step,
                                     const ScenarioDefinition& scenario,
                                     ExecutionContext& context,
                                     InvocationStack& stack) const;

    /// `<log_dir>/command_outputs/<test_id>_<step_id>_<step_name>.txt`, non-word characters folded to `_`.
    [[nodiscard]] std::filesystem::path output_file(const ScenarioDefinition& scenario,
                                                    const StepDefinition& step) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    using Deadline = std::optional<Clock::time_point>;

    void run_command(const StepDefinition& step, const ScenarioDefinition& scenario, ExecutionContext& context,
                     StepResult& result, const Deadline& deadline) const;
    void run_log_analysis(const StepDefinition& step, const ScenarioDefinition& scenario, ExecutionContext& context,
                          StepResult& result, const Deadline& deadline) const;
    void run_invoke(const StepDefinition& step, const ScenarioDefinition& scenario, ExecutionContext& context,
                    InvocationStack& stack, StepResult& result, const Deadline& deadline) const;

    void check_expected(const StepDefinition& step, const ScenarioDefinition& scenario, StepResult& result) const;
    void apply_diagnostics(const StepDefinition& step, const std::string& subject, ExecutionContext& context,
                           StepResult& result) const;

    [[nodiscard]] CommandRequest base_request(const StepDefinition& step, const Deadline& deadline) const;
    void check_cancelled() const;

    Config config_;
};

}  // namespace cpact
