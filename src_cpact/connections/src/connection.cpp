#include "cpact/connection.hpp"

#include <array>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

#include "cpact/errors.hpp"
#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

constexpr auto kConnectTimeout = std::chrono::milliseconds(15000);
constexpr int kSshTransportFailure = 255;
constexpr int kSshpassWrongPassword = 5;
constexpr const char* kSshProbeText = "SSH test successful";
constexpr const char* kRedfishServiceRoot = "/redfish/v1/";

constexpr std::array<const char*, 7> kErrorSignatures = {
    "command not found",
    "permission denied",
    "no such file or directory",
    "segmentation fault",
    "connection refused",
    "sudo: a password is required",
    "traceback (most recent call last)",
};

/// Maps the non-output outcomes of a finished process onto the error taxonomy.
void raise_for_process(const cpact::ProcessResult& result, const std::string& target) {
    if (!result.error_message.empty()) {
        throw cpact::ConnectionError(cpact::ConnectionFailure::unreachable, target, result.error_message);
    }
    if (result.cancelled) {
        throw cpact::CancelledError("Command on '" + target + "' was cancelled");
    }
    if (result.timed_out) {
        throw cpact::TimeoutError("Command on '" + target + "' exceeded its deadline after " +
                                  std::to_string(result.elapsed_s) + "s");
    }
}

cpact::CommandOutput to_output(cpact::ProcessResult&& result) {
    cpact::CommandOutput out;
    out.text = std::move(result.stdout_text);
    out.error_text = std::move(result.stderr_text);
    out.exit_code = result.exit_code;
    out.elapsed_s = result.elapsed_s;
    return out;
}

bool client_missing(const cpact::ProcessResult& result) {
    return result.exit_code == 127 && result.stdout_text.empty() && result.stderr_text.empty();
}

std::string sudo_wrap(const std::string& command, bool with_password) {
    if (with_password) {
        return "sudo -S -p '' sh -c " + cpact::text::shell_quote(command);
    }
    return "sudo -n sh -c " + cpact::text::shell_quote(command);
}

std::string curl_config_quote(const std::string& value) {
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

namespace cpact {

std::optional<std::string> find_error_signature(const std::string& output) {
    for (const char* signature : kErrorSignatures) {
        if (text::icontains(output, signature)) {
            return std::string{signature};
        }
    }
    const auto trimmed = text::trim_copy(output);
    if (!trimmed.empty() && trimmed.front() == '{') {
        const auto body = nlohmann::json::parse(trimmed, nullptr, /*allow_exceptions*/ false);
        if (body.is_object() && body.contains("error") && body["error"].is_object()) {
            const auto& error = body["error"];
            return "redfish error: " + error.value("message", error.value("code", std::string{"unspecified"}));
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------------------
// PortForward

PortForward::PortForward(std::string local_host, int local_port)
    : local_host_(std::move(local_host)), local_port_(local_port), managed_(false) {}

PortForward::PortForward(std::string local_host, int local_port, BackgroundProcess process)
    : local_host_(std::move(local_host)),
      local_port_(local_port),
      managed_(true),
      process_(std::move(process)) {}

bool PortForward::alive() {
    return !managed_ || process_.running();
}

// ----------------------------------------------------------------------------------------
// LocalConnection

void LocalConnection::connect() {
    connected_ = true;
}

CommandOutput LocalConnection::execute(const CommandRequest& request) {
    ProcessSpec spec;
    const auto command = request.use_sudo ? sudo_wrap(request.command, false) : request.command;
    spec.argv = {"/bin/sh", "-c", command};
    spec.timeout = request.timeout;
    spec.cancel = request.cancel;
    auto result = run_process(spec);
    raise_for_process(result, kLocalTarget);
    return to_output(std::move(result));
}

void LocalConnection::disconnect() {
    connected_ = false;
}

bool LocalConnection::probe(std::string& diag) {
    if (!connected_) {
        diag += "local handle is not connected\n";
    }
    return connected_;
}

// ----------------------------------------------------------------------------------------
// SshConnection

SshConnection::SshConnection(ConnectionTarget target, Endpoint endpoint)
    : target_(std::move(target)), endpoint_(std::move(endpoint)) {}

ProcessSpec SshConnection::make_spec(const std::string& remote_command) const {
    ProcessSpec spec;
    if (!target_.password.empty()) {
        spec.argv = {"sshpass", "-e", "ssh"};
        spec.env["SSHPASS"] = target_.password;
    } else {
        spec.argv = {"ssh", "-o", "BatchMode=yes"};
    }
    const std::array<const char*, 8> options = {
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        "-o", "ConnectTimeout=10",
    };
    spec.argv.insert(spec.argv.end(), options.begin(), options.end());
    spec.argv.emplace_back("-p");
    spec.argv.push_back(std::to_string(endpoint_.port));
    spec.argv.push_back(target_.username.empty() ? endpoint_.host : target_.username + "@" + endpoint_.host);
    spec.argv.push_back(remote_command);
    return spec;
}

void SshConnection::connect() {
    auto spec = make_spec("true");
    spec.timeout = kConnectTimeout;
    const auto result = run_process(spec);
    if (!result.error_message.empty() || client_missing(result)) {
        throw ConnectionError(ConnectionFailure::unreachable, target_.name,
                              "ssh client unavailable " + result.error_message);
    }
    if (result.timed_out) {
        throw ConnectionError(ConnectionFailure::unreachable, target_.name,
                              "no answer from " + endpoint_.host + ":" + std::to_string(endpoint_.port));
    }
    if (result.exit_code == kSshpassWrongPassword || text::icontains(result.stderr_text, "permission denied")) {
        throw ConnectionError(ConnectionFailure::auth_failure, target_.name, text::trim_copy(result.stderr_text));
    }
    if (result.exit_code != 0) {
        throw ConnectionError(ConnectionFailure::unreachable, target_.name, text::trim_copy(result.stderr_text));
    }
    connected_ = true;
    CPACT_LOG_DEBUG("SSH session to {} ({}:{}) established", target_.name, endpoint_.host, endpoint_.port);
}

CommandOutput SshConnection::execute(const CommandRequest& request) {
    const bool with_password = !target_.password.empty();
    auto spec = make_spec(request.use_sudo ? sudo_wrap(request.command, with_password) : request.command);
    if (request.use_sudo && with_password) {
        spec.stdin_text = target_.password + "\n";
    }
    spec.timeout = request.timeout;
    spec.cancel = request.cancel;

    auto result = run_process(spec);
    raise_for_process(result, target_.name);
    if (result.exit_code == kSshTransportFailure || client_missing(result)) {
        connected_ = false;
        throw ConnectionError(ConnectionFailure::unreachable, target_.name, text::trim_copy(result.stderr_text));
    }
    if (result.exit_code == kSshpassWrongPassword) {
        connected_ = false;
        throw ConnectionError(ConnectionFailure::auth_failure, target_.name, "password rejected");
    }
    return to_output(std::move(result));
}

void SshConnection::disconnect() {
    connected_ = false;
}

bool SshConnection::probe(std::string& diag) {
    auto spec = make_spec(std::string{"echo \""} + kSshProbeText + "\"");
    spec.timeout = kConnectTimeout;
    const auto result = run_process(spec);
    if (result.exit_code == 0 && result.stdout_text.find(kSshProbeText) != std::string::npos) {
        return true;
    }
    diag += "ssh probe of " + target_.name + " failed (exit " + std::to_string(result.exit_code) + "): " +
            text::trim_copy(result.stderr_text) + "\n";
    return false;
}

// ----------------------------------------------------------------------------------------
// RedfishConnection

RedfishConnection::RedfishConnection(ConnectionTarget target, Endpoint endpoint)
    : target_(std::move(target)), endpoint_(std::move(endpoint)) {}

std::string RedfishConnection::base_url() const {
    return std::string{target_.use_ssl ? "https" : "http"} + "://" + endpoint_.host + ":" +
           std::to_string(endpoint_.port);
}

CommandOutput RedfishConnection::execute(const CommandRequest& request) {
    auto path = text::trim_copy(request.command);
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    std::string method = request.method.empty() ? "GET" : request.method;
    for (auto& ch : method) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }

    ProcessSpec spec;
    spec.argv = {"curl", "-sS", "-k", "-K", "-", "-X", method, "-w", "\n%{http_code}",
                 "-H", "Accept: application/json"};
    if (!request.body.empty()) {
        spec.argv.insert(spec.argv.end(), {"-H", "Content-Type: application/json", "--data-binary", request.body});
    }
    for (const auto& [name, value] : request.headers) {
        spec.argv.emplace_back("-H");
        spec.argv.push_back(name + ": " + value);
    }
    spec.argv.push_back(base_url() + path);
    // Credentials travel through curl's config on stdin so they never show up in argv.
    spec.stdin_text = target_.username.empty()
                          ? std::string{"\n"}
                          : "user = " + curl_config_quote(target_.username + ":" + target_.password) + "\n";
    spec.timeout = request.timeout;
    spec.cancel = request.cancel;

    auto result = run_process(spec);
    raise_for_process(result, target_.name);
    if (result.exit_code == 28) {
        throw TimeoutError("Redfish request to '" + target_.name + "' timed out");
    }
    if (result.exit_code != 0) {
        connected_ = false;
        throw ConnectionError(ConnectionFailure::unreachable, target_.name,
                              "curl exit " + std::to_string(result.exit_code) + ": " +
                                  text::trim_copy(result.stderr_text));
    }

    auto out = to_output(std::move(result));
    const auto split = out.text.find_last_of('\n');
    const auto status_text = split == std::string::npos ? out.text : out.text.substr(split + 1);
    out.text = split == std::string::npos ? std::string{} : out.text.substr(0, split);
    out.exit_code = static_cast<int>(text::parse_number(status_text).value_or(0));

    if (out.exit_code == 401 || out.exit_code == 403) {
        connected_ = false;
        throw ConnectionError(ConnectionFailure::auth_failure, target_.name,
                              "HTTP " + std::to_string(out.exit_code) + " for " + method + " " + path);
    }
    return out;
}

void RedfishConnection::connect() {
    CommandRequest request;
    request.command = kRedfishServiceRoot;
    request.timeout = kConnectTimeout;
    try {
        const auto out = execute(request);
        if (out.exit_code < 200 || out.exit_code >= 400) {
            throw ConnectionError(ConnectionFailure::unreachable, target_.name,
                                  "service root answered HTTP " + std::to_string(out.exit_code));
        }
    } catch (const TimeoutError& e) {
        throw ConnectionError(ConnectionFailure::unreachable, target_.name, e.what());
    }
    connected_ = true;
    CPACT_LOG_DEBUG("Redfish service at {} reachable for {}", base_url(), target_.name);
}

void RedfishConnection::disconnect() {
    connected_ = false;
}

bool RedfishConnection::probe(std::string& diag) {
    CommandRequest request;
    request.command = kRedfishServiceRoot;
    request.timeout = kConnectTimeout;
    try {
        const auto out = execute(request);
        if (out.exit_code >= 200 && out.exit_code < 400) {
            return true;
        }
        diag += "redfish probe of " + target_.name + " answered HTTP " + std::to_string(out.exit_code) + "\n";
    } catch (const Error& e) {
        diag += std::string{"redfish probe of "} + target_.name + " failed: " + e.what() + "\n";
    }
    return false;
}

// ----------------------------------------------------------------------------------------
// TunnelConnection

TunnelConnection::TunnelConnection(std::shared_ptr<PortForward> forward, std::unique_ptr<ConnectionHandle> inner)
    : forward_(std::move(forward)), inner_(std::move(inner)) {}

TunnelConnection::~TunnelConnection() = default;
TunnelConnection::TunnelConnection(TunnelConnection&&) noexcept = default;
TunnelConnection& TunnelConnection::operator=(TunnelConnection&&) noexcept = default;

void TunnelConnection::connect() {
    if (!forward_->alive()) {
        throw ConnectionError(ConnectionFailure::tunnel_setup_failure, inner_->protocol(),
                              "port forward on " + forward_->local_host() + ":" +
                                  std::to_string(forward_->local_port()) + " is down");
    }
    inner_->connect();
}

CommandOutput TunnelConnection::execute(const CommandRequest& request) {
    return inner_->execute(request);
}

void TunnelConnection::disconnect() {
    inner_->disconnect();
}

bool TunnelConnection::alive() const {
    return forward_->alive() && inner_->alive();
}

bool TunnelConnection::probe(std::string& diag) {
    if (!forward_->alive()) {
        diag += "port forward on " + forward_->local_host() + ":" + std::to_string(forward_->local_port()) +
                " is down\n";
        return false;
    }
    return inner_->probe(diag);
}

// ----------------------------------------------------------------------------------------
// ConnectionHandle

ConnectionHandle::ConnectionHandle(Variant impl) : impl_(std::move(impl)) {}

void ConnectionHandle::connect() {
    std::visit(overloaded{
                   [](ExternalConnection& c) {
                       if (c.connect) {
                           c.connect();
                       }
                   },
                   [](auto& c) { c.connect(); },
               },
               impl_);
}

CommandOutput ConnectionHandle::execute(const CommandRequest& request) {
    return std::visit(overloaded{
                          [&](ExternalConnection& c) {
                              if (!c.execute) {
                                  throw ConnectionError(ConnectionFailure::unreachable, c.protocol,
                                                        "protocol has no execute capability");
                              }
                              return c.execute(request);
                          },
                          [&](auto& c) { return c.execute(request); },
                      },
                      impl_);
}

void ConnectionHandle::disconnect() {
    std::visit(overloaded{
                   [](ExternalConnection& c) {
                       if (c.disconnect) {
                           c.disconnect();
                       }
                   },
                   [](auto& c) { c.disconnect(); },
               },
               impl_);
}

bool ConnectionHandle::alive() const {
    return std::visit(overloaded{
                          [](const ExternalConnection& c) { return !c.alive || c.alive(); },
                          [](const auto& c) { return c.alive(); },
                      },
                      impl_);
}

bool ConnectionHandle::probe(std::string& diag) {
    return std::visit(overloaded{
                          [&](ExternalConnection& c) {
                              const bool ok = !c.alive || c.alive();
                              if (!ok) {
                                  diag += c.protocol + " handle reports not alive\n";
                              }
                              return ok;
                          },
                          [&](auto& c) { return c.probe(diag); },
                      },
                      impl_);
}

std::string ConnectionHandle::protocol() const {
    return std::visit(overloaded{
                          [](const LocalConnection&) { return std::string{"local"}; },
                          [](const SshConnection&) { return std::string{"ssh"}; },
                          [](const RedfishConnection&) { return std::string{"redfish"}; },
                          [](const TunnelConnection&) { return std::string{"tunnel"}; },
                          [](const ExternalConnection& c) { return c.protocol; },
                      },
                      impl_);
}

}  // namespace cpact
