#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpact::text {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string trim_copy(std::string_view input);
[[nodiscard]] std::string trim_right_copy(std::string_view input);
[[nodiscard]] std::string to_lower_copy(std::string_view input);

/// Splits on \p separator, trimming each piece and dropping empty ones.
[[nodiscard]] std::vector<std::string> split_list(std::string_view input, char separator);

/// Splits on any whitespace run.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view input);

/// Parses the whole of \p input as a decimal number (surrounding whitespace allowed).
[[nodiscard]] std::optional<double> parse_number(std::string_view input);

/// true/yes/1 and false/no/0, case-insensitive.
[[nodiscard]] std::optional<bool> parse_boolean(std::string_view input);

/// Case-insensitive substring search.
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle);

/// Quotes \p value for /bin/sh using single quotes.
[[nodiscard]] std::string shell_quote(std::string_view value);

}  // namespace cpact::text
