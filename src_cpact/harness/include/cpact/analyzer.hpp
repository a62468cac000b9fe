#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "scenario.hpp"
#include "value.hpp"

namespace cpact::analysis {

/// Result of comparing output with an expectation. A mismatch is data, never an exception.
struct Validation {
    bool ok{false};
    std::string detail;
};

/**
 * \brief Checks \p output against \p expected.
 *
 * - `json`: both sides parsed and compared structurally; object keys are unordered,
 *   arrays are ordered.
 * - `regex` / `text_regex`: \p expected must match the whole output (trailing whitespace
 *   of the output ignored).
 * - `exact`: equality after trimming trailing whitespace on both sides.
 * - `text` (also the empty type): regex search, then plain substring, then every
 *   whitespace-separated token of \p expected present in the output.
 */
[[nodiscard]] Validation validate(const std::string& output,
                                  const std::string& validator_type,
                                  const std::string& expected);

/// Applies each rule's regex to \p output; first capture group, or whole match, per parameter.
[[nodiscard]] std::map<std::string, Value> analyze_output(const std::string& output,
                                                          const std::vector<OutputRule>& rules);

struct DiagnosticOutcome {
    std::optional<std::string> result_code;  ///< last matching code
    std::vector<std::string> codes;          ///< every matching code, in rule order
    std::map<std::string, Value> parameters;
    bool failed{false};                      ///< a failure-severity code matched
    bool terminated{false};                  ///< a terminal rule stopped evaluation
};

/**
 * \brief Applies diagnostic rules in declaration order with cumulative effect.
 *
 * Every matching rule contributes; a matching rule marked terminal stops evaluation.
 * Malformed rules are skipped with a warning.
 */
[[nodiscard]] DiagnosticOutcome analyze_diagnostics(const std::string& log_text,
                                                    const std::vector<DiagnosticRule>& rules);

}  // namespace cpact::analysis
