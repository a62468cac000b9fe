#include "cpact/context.hpp"

#include <algorithm>

#include "cpact/errors.hpp"

namespace cpact {

Value ExecutionContext::get(const std::string& name) const {
    for (const auto* layer = this; layer != nullptr; layer = layer->parent_) {
        if (const auto it = layer->values_.find(name); it != layer->values_.end()) {
            return it->second;
        }
    }
    return Value{};
}

bool ExecutionContext::contains(const std::string& name) const {
    for (const auto* layer = this; layer != nullptr; layer = layer->parent_) {
        if (layer->values_.count(name) != 0) {
            return true;
        }
    }
    return false;
}

void ExecutionContext::set(const std::string& name, Value value) {
    values_[name] = std::move(value);
}

std::map<std::string, Value> ExecutionContext::flatten() const {
    std::map<std::string, Value> merged = parent_ != nullptr ? parent_->flatten() : std::map<std::string, Value>{};
    for (const auto& [name, value] : values_) {
        merged[name] = value;
    }
    return merged;
}

bool InvocationStack::contains(const std::string& scenario_id) const {
    return std::find(chain_.begin(), chain_.end(), scenario_id) != chain_.end();
}

void InvocationStack::push(const std::string& scenario_id) {
    if (contains(scenario_id)) {
        throw CycleError(scenario_id, chain_);
    }
    chain_.push_back(scenario_id);
}

void InvocationStack::pop() {
    if (!chain_.empty()) {
        chain_.pop_back();
    }
}

std::optional<InvocationStack::Clock::time_point> InvocationStack::deadline() const {
    if (deadlines_.empty()) {
        return std::nullopt;
    }
    return *std::min_element(deadlines_.begin(), deadlines_.end());
}

}  // namespace cpact
