// parse.hpp - Safe noexcept parsing for key=value ring config and state text
//
// Usage:
//   int n   = unified_ring::parse::parse_int("42");            // 42
//   auto f  = unified_ring::parse::try_parse_float("0.5");     // std::optional<float>{0.5f}
//   auto b  = unified_ring::parse::try_parse_bool("true");     // std::optional<bool>{true}
//   auto kv = unified_ring::parse::split_key_value("a = 1");   // {"a", "1"}
//
// All parse functions are noexcept. Bad input returns the default or nullopt.
#pragma once

#include <charconv>
#include <cstddef>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace unified_ring::parse {

    // Arithmetic types that we can parse (excludes bool and the char-like types)
    template<typename T>
    concept parseable_arithmetic = std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
                                   !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> &&
                                   !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

    [[nodiscard]]
    constexpr std::string_view trim(const std::string_view sv) noexcept {
        const auto first = sv.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};
        const auto last = sv.find_last_not_of(" \t\r\n");
        return sv.substr(first, last - first + 1);
    }

    // Whole-token parse: trailing garbage ("12px") is a failure, surrounding whitespace is not.
    template<parseable_arithmetic T>
    [[nodiscard]]
    constexpr std::optional<T> try_parse(const std::string_view sv) noexcept {
        const std::string_view token = trim(sv);
        T result{};
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
        if (ec == std::errc{} && ptr == token.data() + token.size() && !token.empty()) return result;
        return std::nullopt;
    }

    template<parseable_arithmetic T>
    [[nodiscard]]
    constexpr T parse_value(const std::string_view sv, const T default_val = T{}) noexcept {
        return try_parse<T>(sv).value_or(default_val);
    }

    [[nodiscard]]
    constexpr int parse_int(const std::string_view sv, const int default_val = 0) noexcept {
        return parse_value<int>(sv, default_val);
    }

    [[nodiscard]]
    constexpr float parse_float(const std::string_view sv, const float default_val = 0.0f) noexcept {
        return parse_value<float>(sv, default_val);
    }

    [[nodiscard]]
    constexpr std::optional<int> try_parse_int(const std::string_view sv) noexcept {
        return try_parse<int>(sv);
    }

    [[nodiscard]]
    constexpr std::optional<float> try_parse_float(const std::string_view sv) noexcept {
        return try_parse<float>(sv);
    }

    // Accepts true/false, 1/0, yes/no, on/off (lower case only).
    [[nodiscard]]
    constexpr std::optional<bool> try_parse_bool(const std::string_view sv) noexcept {
        const std::string_view token = trim(sv);
        if (token == "true" || token == "1" || token == "yes" || token == "on") return true;
        if (token == "false" || token == "0" || token == "no" || token == "off") return false;
        return std::nullopt;
    }

    // Split "key=value" at the first '='. Both halves are trimmed.
    // Returns nullopt when there is no '=' or the key is empty.
    [[nodiscard]]
    constexpr std::optional<std::pair<std::string_view, std::string_view>>
    split_key_value(const std::string_view line) noexcept {
        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) return std::nullopt;
        const std::string_view key = trim(line.substr(0, eq));
        if (key.empty()) return std::nullopt;
        return std::pair{key, trim(line.substr(eq + 1))};
    }

    // Invoke fn(line_number, line) for every line; line numbers start at 1.
    // Handles both "\n" and "\r\n" endings; a trailing newline produces no empty line.
    template<typename Fn>
        requires std::invocable<Fn, size_t, std::string_view>
    constexpr void for_each_line(std::string_view text, Fn fn) {
        size_t number = 0;
        while (!text.empty()) {
            const size_t     nl   = text.find('\n');
            std::string_view line = nl == std::string_view::npos ? text : text.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            fn(++number, line);
            text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
        }
    }

} // namespace unified_ring::parse
