// error.hpp - ring error types with std::expected integration
//
// Usage:
//   auto state = unified_ring::load_saved_state_file(p);
//   if (!state) Log::warning("Ring", state.error().message());
//
//   unified_ring::ring_expected<int> parse_count(std::string_view s);
//   return unified_ring::make_ring_error(ring_error_code::file_malformed, "missing '='");
#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace unified_ring {

    enum class ring_error_code : std::uint8_t {
        file_open_failed,
        file_write_failed,
        file_malformed,
        value_out_of_range
    };

    [[nodiscard]] constexpr std::string_view to_string(const ring_error_code code) noexcept {
        using enum ring_error_code;
        switch (code) {
            case file_open_failed:
                return "Could not open file";
            case file_write_failed:
                return "Failed to write file";
            case file_malformed:
                return "File contains invalid data";
            case value_out_of_range:
                return "Value out of range";
        }
        return "Unknown ring error";
    }

    struct ring_error {
        ring_error_code code;
        std::string     detail;

        explicit constexpr ring_error(const ring_error_code c) noexcept : code{c} {}
        explicit ring_error(const ring_error_code c, std::string d) : code{c}, detail{std::move(d)} {}

        [[nodiscard]] std::string message() const {
            if (detail.empty()) return std::string(to_string(code));
            return std::format("{}: {}", to_string(code), detail);
        }

        [[nodiscard]] constexpr std::string_view code_name() const noexcept { return to_string(code); }

        [[nodiscard]] bool operator==(const ring_error &other) const noexcept {
            return code == other.code && detail == other.detail;
        }

        friend std::ostream &operator<<(std::ostream &os, const ring_error &err) { return os << err.message(); }
    };

    inline std::ostream &operator<<(std::ostream &os, const ring_error_code code) {
        return os << to_string(code);
    }

    template<typename T>
    using ring_expected      = std::expected<T, ring_error>;
    using ring_expected_void = std::expected<void, ring_error>;

    [[nodiscard]] constexpr std::unexpected<ring_error> make_ring_error(const ring_error_code code) {
        return std::unexpected{ring_error{code}};
    }

    [[nodiscard]] inline std::unexpected<ring_error> make_ring_error(const ring_error_code code, std::string detail) {
        return std::unexpected{ring_error{code, std::move(detail)}};
    }

} // namespace unified_ring

template<>
struct std::formatter<unified_ring::ring_error_code> {
    static constexpr auto parse(const std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const unified_ring::ring_error_code code, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}", unified_ring::to_string(code));
    }
};

template<>
struct std::formatter<unified_ring::ring_error> {
    static constexpr auto parse(const std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const unified_ring::ring_error &err, std::format_context &ctx) {
        if (err.detail.empty()) return std::format_to(ctx.out(), "{}", unified_ring::to_string(err.code));
        return std::format_to(ctx.out(), "{}: {}", unified_ring::to_string(err.code), err.detail);
    }
};
