/// @file keyframe.hpp
/// @brief Piecewise-linear keyframe curve over normalized time.
///
/// Usage:
/// @code
///   const unified_ring::keyframe_curve c{{0.0f, 0.0f}, {0.5f, 0.2f}, {1.0f, 1.2f}};
///   float v = c.evaluate(0.25f); // 0.1
/// @endcode
///
/// There is no easing: velocity changes come from keyframe placement alone.
#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace unified_ring {

    /// @brief A value pinned at a fraction of a timeline's duration.
    struct keyframe {
        float fraction; ///< Normalized time in [0, 1].
        float value;    ///< Value reached at @p fraction.

        [[nodiscard]] constexpr bool operator==(const keyframe &) const noexcept = default;
    };

    class keyframe_curve {
    public:
        keyframe_curve() = default;

        keyframe_curve(const std::initializer_list<keyframe> keys) : keys_(keys) { sort(); }

        explicit keyframe_curve(std::vector<keyframe> keys) : keys_(std::move(keys)) { sort(); }

        /**
         * @brief Linear interpolation at @p fraction.
         *
         * Clamped to the first/last keyframe. An empty curve evaluates to 0 and a
         * zero-width segment yields its left value.
         */
        [[nodiscard]] float evaluate(const float fraction) const noexcept {
            if (keys_.empty()) return 0.0f;
            if (keys_.size() == 1 || fraction <= keys_.front().fraction) return keys_.front().value;
            if (fraction >= keys_.back().fraction) return keys_.back().value;

            auto it = std::ranges::upper_bound(keys_, fraction, std::less{}, &keyframe::fraction);
            const auto &k1 = *it;
            const auto &k0 = *(it - 1);
            const float dt = k1.fraction - k0.fraction;
            if (dt <= 0.0f) return k0.value;

            const float u = (fraction - k0.fraction) / dt;
            return k0.value + (k1.value - k0.value) * u;
        }

        [[nodiscard]] float front_value() const noexcept { return keys_.empty() ? 0.0f : keys_.front().value; }
        [[nodiscard]] float back_value() const noexcept { return keys_.empty() ? 0.0f : keys_.back().value; }

        [[nodiscard]] std::span<const keyframe> keys() const noexcept { return keys_; }
        [[nodiscard]] std::size_t               size() const noexcept { return keys_.size(); }
        [[nodiscard]] bool                      empty() const noexcept { return keys_.empty(); }

        [[nodiscard]] bool operator==(const keyframe_curve &) const noexcept = default;

    private:
        void sort() { std::ranges::stable_sort(keys_, {}, &keyframe::fraction); }

        std::vector<keyframe> keys_;
    };

} // namespace unified_ring
