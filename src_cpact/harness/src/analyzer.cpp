#include "cpact/analyzer.hpp"

#include <stdexcept>

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

#include "cpact/logging.hpp"
#include "cpact/text.hpp"

namespace {

constexpr std::size_t kPreviewLength = 200;

std::string preview(const std::string& value) {
    if (value.size() <= kPreviewLength) {
        return value;
    }
    return value.substr(0, kPreviewLength) + "...";
}

cpact::analysis::Validation mismatch(const std::string& expected, const std::string& actual) {
    return {false, "expected '" + preview(expected) + "' but got '" + preview(actual) + "'"};
}

std::optional<boost::regex> compile(const std::string& pattern) {
    try {
        return boost::regex(pattern);
    } catch (const boost::regex_error& e) {
        CPACT_LOG_WARN("Invalid regular expression '{}': {}", pattern, e.what());
        return std::nullopt;
    }
}

// Boost's matcher keeps its backtracking state on the heap and gives up with
// std::runtime_error once a match grows too expensive; that counts as no match.
bool full_match(const std::string& subject, const boost::regex& re) {
    try {
        return boost::regex_match(subject, re);
    } catch (const std::runtime_error& e) {
        CPACT_LOG_WARN("Regular expression /{}/ abandoned on {} bytes: {}", re.str(), subject.size(), e.what());
        return false;
    }
}

bool search(const std::string& subject, boost::smatch& match, const boost::regex& re) {
    try {
        return boost::regex_search(subject, match, re);
    } catch (const std::runtime_error& e) {
        CPACT_LOG_WARN("Regular expression /{}/ abandoned on {} bytes: {}", re.str(), subject.size(), e.what());
        return false;
    }
}

/// First capture group when the pattern has one and it took part in the match, else the whole match.
std::string captured(const boost::smatch& match) {
    if (match.size() > 1 && match[1].matched) {
        return match[1].str();
    }
    return match[0].str();
}

cpact::analysis::Validation validate_json(const std::string& output, const std::string& expected) {
    const auto actual_doc = nlohmann::json::parse(output, nullptr, /*allow_exceptions*/ false);
    if (actual_doc.is_discarded()) {
        return {false, "output is not valid JSON: '" + preview(output) + "'"};
    }
    const auto expected_doc = nlohmann::json::parse(expected, nullptr, /*allow_exceptions*/ false);
    if (expected_doc.is_discarded()) {
        return {false, "expected output is not valid JSON: '" + preview(expected) + "'"};
    }
    if (actual_doc == expected_doc) {
        return {true, {}};
    }
    return mismatch(expected_doc.dump(), actual_doc.dump());
}

cpact::analysis::Validation validate_regex(const std::string& output, const std::string& expected) {
    const auto re = compile(expected);
    if (!re) {
        return {false, "invalid regular expression '" + expected + "'"};
    }
    const auto subject = cpact::text::trim_right_copy(output);
    if (full_match(subject, *re)) {
        return {true, {}};
    }
    return {false, "output does not fully match /" + expected + "/: '" + preview(subject) + "'"};
}

cpact::analysis::Validation validate_exact(const std::string& output, const std::string& expected) {
    if (cpact::text::trim_right_copy(output) == cpact::text::trim_right_copy(expected)) {
        return {true, {}};
    }
    return mismatch(expected, output);
}

cpact::analysis::Validation validate_text(const std::string& output, const std::string& expected) {
    if (const auto re = compile(expected)) {
        boost::smatch match;
        if (search(output, match, *re)) {
            return {true, {}};
        }
    }
    if (output.find(expected) != std::string::npos) {
        return {true, {}};
    }
    const auto tokens = cpact::text::split_whitespace(expected);
    if (tokens.empty()) {
        return {true, {}};
    }
    for (const auto& token : tokens) {
        if (output.find(token) == std::string::npos) {
            return {false, "token '" + token + "' of the expected output is missing from '" + preview(output) + "'"};
        }
    }
    return {true, {}};
}

bool malformed(const cpact::DiagnosticRule& rule, std::string& why) {
    const bool code_rule = !rule.search_string.empty();
    const bool extract_rule = !rule.diagnostic_search_string.empty();
    if (code_rule && extract_rule) {
        why = "both search_string and diagnostic_search_string are set";
    } else if (!code_rule && !extract_rule) {
        why = "neither search_string nor diagnostic_search_string is set";
    } else if (code_rule && rule.result_code.empty()) {
        why = "search_string '" + rule.search_string + "' has no diagnostic_result_code";
    } else if (extract_rule && !rule.result_code.empty()) {
        why = "diagnostic_search_string '" + rule.diagnostic_search_string + "' must not carry a result code";
    } else if (extract_rule && rule.parameter.empty()) {
        why = "diagnostic_search_string '" + rule.diagnostic_search_string + "' has no parameter_to_set";
    } else {
        return false;
    }
    return true;
}

}  // namespace

namespace cpact::analysis {

Validation validate(const std::string& output, const std::string& validator_type, const std::string& expected) {
    const auto type = text::to_lower_copy(text::trim_copy(validator_type));
    if (type == "json") {
        return validate_json(output, expected);
    }
    if (type == "regex" || type == "text_regex") {
        return validate_regex(output, expected);
    }
    if (type == "exact") {
        return validate_exact(output, expected);
    }
    if (type.empty() || type == "text") {
        return validate_text(output, expected);
    }
    return {false, "unknown validator_type '" + validator_type + "'"};
}

std::map<std::string, Value> analyze_output(const std::string& output, const std::vector<OutputRule>& rules) {
    std::map<std::string, Value> parameters;
    for (const auto& rule : rules) {
        if (rule.parameter.empty()) {
            CPACT_LOG_WARN("output_analysis rule /{}/ has no parameter_to_set, skipped", rule.regex);
            continue;
        }
        const auto re = compile(rule.regex);
        if (!re) {
            continue;
        }
        boost::smatch match;
        if (search(output, match, *re)) {
            parameters[rule.parameter] = Value::from_text(text::trim_copy(captured(match)));
            CPACT_LOG_INFO("[output_analysis] {} = {}", rule.parameter, parameters[rule.parameter].to_string());
        } else {
            CPACT_LOG_DEBUG("[output_analysis] /{}/ did not match", rule.regex);
        }
    }
    return parameters;
}

DiagnosticOutcome analyze_diagnostics(const std::string& log_text, const std::vector<DiagnosticRule>& rules) {
    DiagnosticOutcome outcome;
    for (const auto& rule : rules) {
        std::string why;
        if (malformed(rule, why)) {
            CPACT_LOG_WARN("[diagnostic_analysis] rule skipped: {}", why);
            continue;
        }

        bool matched = false;
        if (!rule.search_string.empty()) {
            matched = log_text.find(rule.search_string) != std::string::npos;
            if (matched) {
                outcome.codes.push_back(rule.result_code);
                outcome.result_code = rule.result_code;
                if (text::to_lower_copy(rule.severity) != "info") {
                    outcome.failed = true;
                }
            }
            if (!rule.parameter.empty()) {
                outcome.parameters[rule.parameter] = Value{matched};
            }
            CPACT_LOG_INFO("[diagnostic_analysis] '{}' -> {}{}", rule.search_string, matched ? "matched" : "absent",
                           matched ? " code " + rule.result_code : std::string{});
        } else {
            const auto re = compile(rule.diagnostic_search_string);
            boost::smatch match;
            matched = re && search(log_text, match, *re);
            if (matched && match.size() > 1 && match[1].matched) {
                outcome.parameters[rule.parameter] = Value::from_text(text::trim_copy(match[1].str()));
            } else {
                outcome.parameters[rule.parameter] = Value{matched};
            }
            CPACT_LOG_INFO("[diagnostic_analysis] /{}/ -> {} = {}", rule.diagnostic_search_string, rule.parameter,
                           outcome.parameters[rule.parameter].to_string());
        }

        if (matched && rule.terminal) {
            outcome.terminated = true;
            CPACT_LOG_INFO("[diagnostic_analysis] terminal rule matched, remaining rules not evaluated");
            break;
        }
    }
    return outcome;
}

}  // namespace cpact::analysis
