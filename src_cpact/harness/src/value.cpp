#include "cpact/value.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

#include "cpact/text.hpp"

namespace cpact {

Value Value::from_text(const std::string& raw) {
    if (const auto number = text::parse_number(raw)) {
        return Value{*number};
    }
    return Value{raw};
}

Value Value::from_json(const nlohmann::json& node) {
    if (node.is_boolean()) {
        return Value{node.get<bool>()};
    }
    if (node.is_number()) {
        return Value{node.get<double>()};
    }
    if (node.is_string()) {
        return Value{node.get<std::string>()};
    }
    if (node.is_null()) {
        return Value{};
    }
    return Value{node.dump()};
}

std::string Value::to_string() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined>) {
                return "undefined";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
                    return std::to_string(static_cast<long long>(v));
                }
                std::ostringstream out;
                out << v;
                return out.str();
            }
        },
        data_);
}

bool Value::truthy() const {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined>) {
                return false;
            } else if constexpr (std::is_same_v<T, std::string>) {
                const auto lowered = text::to_lower_copy(v);
                return !v.empty() && lowered != "false" && lowered != "0";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else {
                return v != 0.0;
            }
        },
        data_);
}

nlohmann::json Value::to_json() const {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
                    return static_cast<long long>(v);
                }
                return v;
            } else {
                return v;
            }
        },
        data_);
}

}  // namespace cpact
