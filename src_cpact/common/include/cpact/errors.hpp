#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace cpact {

/**
 * \brief Root of the engine's exception taxonomy.
 *
 * Everything thrown by the engine derives from std::runtime_error so that the CLI can
 * map unexpected failures to an internal-error exit code without special casing.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bad or missing connection/scenario configuration. Fatal before any step runs.
class ConfigError : public Error {
public:
    using Error::Error;
};

/// A scenario or config document failed schema or semantic validation.
class SchemaError : public ConfigError {
public:
    SchemaError(std::string document, std::vector<std::string> problems);

    [[nodiscard]] const std::string& document() const noexcept { return document_; }
    [[nodiscard]] const std::vector<std::string>& problems() const noexcept { return problems_; }

private:
    std::string document_;
    std::vector<std::string> problems_;
};

enum class ConnectionFailure {
    unreachable,
    auth_failure,
    tunnel_setup_failure,
};

[[nodiscard]] const char* to_string(ConnectionFailure kind) noexcept;

class ConnectionError : public Error {
public:
    ConnectionError(ConnectionFailure kind, std::string target, const std::string& detail);

    [[nodiscard]] ConnectionFailure kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& target() const noexcept { return target_; }

private:
    ConnectionFailure kind_;
    std::string target_;
};

/// Output matched a recognised failure signature although the transport succeeded.
class CommandError : public Error {
public:
    CommandError(std::string signature, std::string output);

    [[nodiscard]] const std::string& signature() const noexcept { return signature_; }
    [[nodiscard]] const std::string& output() const noexcept { return output_; }

private:
    std::string signature_;
    std::string output_;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class CancelledError : public Error {
public:
    using Error::Error;
};

/// Malformed entry-criteria syntax. Carries the offending expression and column.
class ExpressionError : public Error {
public:
    ExpressionError(std::string expression, std::size_t position, const std::string& detail);

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::string expression_;
    std::size_t position_;
};

/// invoke_scenario reached a scenario that is already running on the current call chain.
class CycleError : public Error {
public:
    CycleError(std::string scenario_id, std::vector<std::string> chain);

    [[nodiscard]] const std::string& scenario_id() const noexcept { return scenario_id_; }
    [[nodiscard]] const std::vector<std::string>& chain() const noexcept { return chain_; }

private:
    std::string scenario_id_;
    std::vector<std::string> chain_;
};

}  // namespace cpact
