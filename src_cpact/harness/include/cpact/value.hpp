#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace cpact {

/// State of a reference to a parameter that is not in the context.
struct Undefined {
    bool operator==(const Undefined&) const noexcept { return true; }
};

/**
 * \brief Parameter value: string, number or bool, or Undefined.
 *
 * Numbers are doubles. Text captured from command output goes through from_text(), which
 * turns purely numeric text into a number so that `temp > 80` compares numerically.
 */
class Value {
public:
    using Storage = std::variant<Undefined, std::string, double, bool>;

    Value() = default;
    Value(std::string text) : data_(std::move(text)) {}
    Value(const char* text) : data_(std::string{text}) {}
    Value(double number) : data_(number) {}
    Value(int number) : data_(static_cast<double>(number)) {}
    Value(bool flag) : data_(flag) {}

    [[nodiscard]] static Value from_text(const std::string& text);
    [[nodiscard]] static Value from_json(const nlohmann::json& node);

    [[nodiscard]] bool is_undefined() const noexcept { return std::holds_alternative<Undefined>(data_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }

    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] double as_number() const { return std::get<double>(data_); }
    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }

    /// Integral numbers print without a fractional part; Undefined prints as "undefined".
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] bool truthy() const;
    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] const Storage& storage() const noexcept { return data_; }

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.data_ == rhs.data_; }

private:
    Storage data_{};
};

}  // namespace cpact
