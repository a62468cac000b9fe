#include "cpact/errors.hpp"

#include <sstream>
#include <utility>

namespace {

std::string join_problems(const std::string& document, const std::vector<std::string>& problems) {
    std::ostringstream msg;
    msg << "Validation failed for " << document;
    for (const auto& problem : problems) {
        msg << "\n  * " << problem;
    }
    return msg.str();
}

std::string join_chain(const std::string& scenario_id, const std::vector<std::string>& chain) {
    std::ostringstream msg;
    msg << "Scenario '" << scenario_id << "' is already running on the invocation chain: ";
    for (const auto& id : chain) {
        msg << id << " -> ";
    }
    msg << scenario_id;
    return msg.str();
}

}  // namespace

namespace cpact {

SchemaError::SchemaError(std::string document, std::vector<std::string> problems)
    : ConfigError(join_problems(document, problems)),
      document_(std::move(document)),
      problems_(std::move(problems)) {}

const char* to_string(ConnectionFailure kind) noexcept {
    switch (kind) {
    case ConnectionFailure::unreachable:
        return "unreachable";
    case ConnectionFailure::auth_failure:
        return "auth-failure";
    case ConnectionFailure::tunnel_setup_failure:
        return "tunnel-setup-failure";
    }
    return "unknown";
}

ConnectionError::ConnectionError(ConnectionFailure kind, std::string target, const std::string& detail)
    : Error(std::string{"Connection to '"} + target + "' failed (" + to_string(kind) + "): " + detail),
      kind_(kind),
      target_(std::move(target)) {}

CommandError::CommandError(std::string signature, std::string output)
    : Error("Command output matched error signature '" + signature + "'"),
      signature_(std::move(signature)),
      output_(std::move(output)) {}

ExpressionError::ExpressionError(std::string expression, std::size_t position, const std::string& detail)
    : Error("Malformed expression '" + expression + "' at column " + std::to_string(position + 1) +
            ": " + detail),
      expression_(std::move(expression)),
      position_(position) {}

CycleError::CycleError(std::string scenario_id, std::vector<std::string> chain)
    : Error(join_chain(scenario_id, chain)),
      scenario_id_(std::move(scenario_id)),
      chain_(std::move(chain)) {}

}  // namespace cpact
