#pragma once

#include <string>
#include <vector>

#include "context.hpp"

namespace cpact {

/**
 * \brief Evaluates one entry-criteria expression against \p context.
 *
 * Grammar (lowest precedence first):
 * \code{.txt}
 * expr    := and ( ("or" | "||") and )*
 * and     := not ( ("and" | "&&") not )*
 * not     := ("not" | "!") not | cmp
 * cmp     := primary ( ("==" | "!=" | "<" | "<=" | ">" | ">=") primary )?
 * primary := NUMBER | STRING | true | false | IDENT | "(" expr ")"
 * \endcode
 *
 * The whole expression is parsed before anything is evaluated, so a syntax error is
 * reported even in a branch that short-circuiting would skip. Unknown identifiers
 * evaluate to Undefined.
 *
 * \throws ExpressionError on malformed input.
 */
[[nodiscard]] bool evaluate_expression(const std::string& expression, const ExecutionContext& context);

/// Comparison used by the evaluator, exposed for reuse.
[[nodiscard]] bool compare_values(const Value& lhs, const std::string& op, const Value& rhs);

struct GateResult {
    bool pass{true};
    bool errored{false};
    std::string expression;  ///< first expression that was false or malformed
    std::string detail;
};

/// AND-combines \p criteria. A false or malformed expression closes the gate.
[[nodiscard]] GateResult evaluate_entry_criteria(const std::vector<std::string>& criteria,
                                                 const ExecutionContext& context);

}  // namespace cpact
