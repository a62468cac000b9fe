#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "value.hpp"

namespace cpact {

/**
 * \brief Parameter store of one scenario invocation.
 *
 * A context made with child() reads through to its parent but writes only to its own
 * layer, so parameters set by an invoked sub-scenario stay invisible to the caller unless
 * they are exported explicitly. The parent must outlive the child.
 */
class ExecutionContext {
public:
    ExecutionContext() = default;
    explicit ExecutionContext(const ExecutionContext* parent) : parent_(parent) {}

    /// Undefined when neither this layer nor any ancestor has \p name.
    [[nodiscard]] Value get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;

    void set(const std::string& name, Value value);

    [[nodiscard]] ExecutionContext child() const { return ExecutionContext{this}; }
    [[nodiscard]] const ExecutionContext* parent() const noexcept { return parent_; }

    /// This layer only.
    [[nodiscard]] const std::map<std::string, Value>& local() const noexcept { return values_; }

    /// Every visible parameter, nearest layer winning.
    [[nodiscard]] std::map<std::string, Value> flatten() const;

private:
    const ExecutionContext* parent_{nullptr};
    std::map<std::string, Value> values_;
};

/**
 * \brief Scenario ids on the current invoke_scenario call chain.
 *
 * Also carries the deadlines of the invoke_scenario steps that are still running, so that
 * steps of an invoked scenario stop when an enclosing step's duration expires.
 */
class InvocationStack {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] bool contains(const std::string& scenario_id) const;

    /// Throws CycleError when \p scenario_id is already on the chain.
    void push(const std::string& scenario_id);
    void pop();

    [[nodiscard]] const std::vector<std::string>& chain() const noexcept { return chain_; }
    [[nodiscard]] std::size_t depth() const noexcept { return chain_.size(); }

    /// Earliest deadline of the enclosing invoke_scenario steps, if any has one.
    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /// Pushes on construction and pops on every exit path.
    class Guard {
    public:
        Guard(InvocationStack& stack, const std::string& scenario_id) : stack_(stack) { stack_.push(scenario_id); }
        ~Guard() { stack_.pop(); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        InvocationStack& stack_;
    };

    /// Bounds everything run on the stack by \p deadline while alive; no-op for nullopt.
    class DeadlineScope {
    public:
        DeadlineScope(InvocationStack& stack, const std::optional<Clock::time_point>& deadline)
            : stack_(stack), active_(deadline.has_value()) {
            if (active_) {
                stack_.deadlines_.push_back(*deadline);
            }
        }
        ~DeadlineScope() {
            if (active_) {
                stack_.deadlines_.pop_back();
            }
        }
        DeadlineScope(const DeadlineScope&) = delete;
        DeadlineScope& operator=(const DeadlineScope&) = delete;

    private:
        InvocationStack& stack_;
        bool active_;
    };

private:
    std::vector<std::string> chain_;
    std::vector<Clock::time_point> deadlines_;
};

}  // namespace cpact
