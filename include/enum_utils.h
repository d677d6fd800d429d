#pragma once

#include <cctype>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>

// Enum <-> string conversion for config keys and CLI flags

namespace enum_utils {

// "EditDistance" -> "edit_distance"
inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);

    for (size_t i = 0; i < pascal.size(); ++i) {
        char c = pascal[i];
        if (std::isupper(static_cast<unsigned char>(c))) {
            if (i > 0) {
                result += '_';
            }
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

// "edit_distance" or "edit-distance" -> "EditDistance"
inline std::string toPascalCase(std::string_view snake) {
    std::string result;
    result.reserve(snake.size());

    bool capitalize_next = true;
    for (char c : snake) {
        if (c == '_' || c == '-') {
            capitalize_next = true;
        } else if (capitalize_next) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize_next = false;
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

// snake_case name, as written in TOML and on the command line
template <typename E>
std::string toString(E value) {
    return toSnakeCase(magic_enum::enum_name(value));
}

template <typename E>
std::optional<E> fromString(std::string_view str) {
    auto direct = magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
    if (direct.has_value()) {
        return direct;
    }
    return magic_enum::enum_cast<E>(toPascalCase(str));
}

// "a, b, c" for error messages and usage text
template <typename E>
std::string joinedNames() {
    std::string joined;
    for (auto value : magic_enum::enum_values<E>()) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += toString(value);
    }
    return joined;
}

} // namespace enum_utils
