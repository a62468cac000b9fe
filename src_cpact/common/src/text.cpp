#include "cpact/text.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace cpact::text {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string trim_right_copy(std::string_view input) {
    const auto end = input.find_last_not_of(kWhitespace);
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string{input.substr(0, end + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::vector<std::string> split_list(std::string_view input, char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= input.size()) {
        auto end = input.find(separator, start);
        if (end == std::string_view::npos) {
            end = input.size();
        }
        auto piece = trim_copy(input.substr(start, end - start));
        if (!piece.empty()) {
            parts.push_back(std::move(piece));
        }
        start = end + 1;
    }
    return parts;
}

std::vector<std::string> split_whitespace(std::string_view input) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos < input.size()) {
        const auto begin = input.find_first_not_of(kWhitespace, pos);
        if (begin == std::string_view::npos) {
            break;
        }
        auto end = input.find_first_of(kWhitespace, begin);
        if (end == std::string_view::npos) {
            end = input.size();
        }
        parts.emplace_back(input.substr(begin, end - begin));
        pos = end;
    }
    return parts;
}

std::optional<double> parse_number(std::string_view input) {
    const auto trimmed = trim_copy(input);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const char first = trimmed.front();
    if (!(std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.')) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (errno != 0 || end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_boolean(std::string_view input) {
    const auto lowered = to_lower_copy(trim_copy(input));
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    return std::nullopt;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                [](char a, char b) {
                                    return std::tolower(static_cast<unsigned char>(a)) ==
                                           std::tolower(static_cast<unsigned char>(b));
                                });
    return it != haystack.end();
}

std::string shell_quote(std::string_view value) {
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

}  // namespace cpact::text
