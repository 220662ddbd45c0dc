/// @file ring_io.hpp
/// @brief Text persistence for ring configuration and widget state.
///
/// Format: one "key=value" per line, led by "version=N". Unknown keys are
/// ignored so newer files still load; a missing or different version is
/// logged and loading continues.
///
/// Usage:
/// @code
///   if (auto r = unified_ring::save_saved_state_file("ring.state", ring.save_state()); !r)
///       Log::error("App", r.error().message());
///
///   if (auto state = unified_ring::load_saved_state_file("ring.state"))
///       ring.restore_state(*state);
/// @endcode
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "unified_ring/anim/ring_animator.hpp"
#include "unified_ring/core/error.hpp"
#include "unified_ring/widgets/saved_state.hpp"

namespace unified_ring {

    inline constexpr int ring_file_version = 1; ///< Bumped on breaking format changes.

    // --- ring_config: duration_ms, small_arc_threshold, threshold_inclusive ---

    [[nodiscard]] std::string format_config(const ring_config &cfg);

    /**
     * @brief Parse a config, starting from the defaults.
     *
     * Fails with file_malformed on a line without '=' or an unparsable value,
     * and with value_out_of_range for a non-positive duration or a threshold
     * outside [0, 1].
     */
    [[nodiscard]] ring_expected<ring_config> parse_config(std::string_view text);

    [[nodiscard]] ring_expected_void          save_config_file(const std::filesystem::path &path, const ring_config &cfg);
    [[nodiscard]] ring_expected<ring_config> load_config_file(const std::filesystem::path &path);

    // --- ring_saved_state: progress, indeterminate ---

    [[nodiscard]] std::string                     format_saved_state(const ring_saved_state &state);
    [[nodiscard]] ring_expected<ring_saved_state> parse_saved_state(std::string_view text);

    [[nodiscard]] ring_expected_void save_saved_state_file(const std::filesystem::path &path,
                                                           const ring_saved_state      &state);
    [[nodiscard]] ring_expected<ring_saved_state> load_saved_state_file(const std::filesystem::path &path);

} // namespace unified_ring
