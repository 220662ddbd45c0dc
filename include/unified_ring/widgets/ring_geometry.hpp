// ring_geometry.hpp - Arc angles, bounds and sizing for drawing a progress ring
//
// Usage:
//   const auto arc = unified_ring::arc_for(ring.angles(), rtl);   // degrees, 0 = +x, clockwise
//   const auto box = unified_ring::fit_square(w, h, rtl);          // square, centred in w x h
//   const float side = unified_ring::measure({24, 48}, unified_ring::ring_metrics::intrinsic_size);
//
// Screen space: y grows downwards, so positive sweeps run clockwise and -90 is twelve o'clock.
#pragma once

#include <algorithm>

#include "unified_ring/anim/ring_animator.hpp"

namespace unified_ring {

    /// Proportions of the ring inside its square drawable box.
    struct ring_metrics {
        static constexpr float intrinsic_size  = 48.0f; // design box side
        static constexpr float progress_radius = 19.0f; // arc centre line, in design units
        static constexpr float border_width    = 4.0f;  // stroke width, in design units
    };

    struct arc_degrees {
        float start_deg = 0.0f;
        float sweep_deg = 0.0f;

        [[nodiscard]] constexpr bool operator==(const arc_degrees &) const noexcept = default;
    };

    struct ring_box {
        float left   = 0.0f;
        float top    = 0.0f;
        float right  = 0.0f;
        float bottom = 0.0f;

        [[nodiscard]] constexpr float width() const noexcept { return right - left; }
        [[nodiscard]] constexpr float height() const noexcept { return bottom - top; }
        [[nodiscard]] constexpr bool  operator==(const ring_box &) const noexcept = default;
    };

    struct size_limits {
        float min = 24.0f;
        float max = 48.0f;
    };

    /// @brief Convert ring angles to a start angle and sweep in degrees, optionally mirrored left-right.
    [[nodiscard]] constexpr arc_degrees arc_for(const ring_angles angles, const bool mirrored = false) noexcept {
        const float start = 360.0f * angles.start - 90.0f;
        const float sweep = 360.0f * (angles.end - angles.start);
        if (!mirrored) return {.start_deg = start, .sweep_deg = sweep};
        return {.start_deg = 180.0f - start, .sweep_deg = -sweep};
    }

    /// @brief Largest square centred in a @p width x @p height content box, mirrored for right-to-left layouts.
    [[nodiscard]] constexpr ring_box fit_square(const float width, const float height, const bool mirror) noexcept {
        ring_box box{.left = 0.0f, .top = 0.0f, .right = width, .bottom = height};
        if (width <= 0.0f || height <= 0.0f) return box;

        if (width > height) {
            box.left  = (width - height) * 0.5f;
            box.right = box.left + height;
        } else if (height > width) {
            box.top    = (height - width) * 0.5f;
            box.bottom = box.top + width;
        }

        if (mirror) {
            const float left = box.left;
            box.left         = width - box.right;
            box.right        = width - left;
        }
        return box;
    }

    /// @brief Clamp an intrinsic size into the widget's limits.
    [[nodiscard]] constexpr float measure(const size_limits limits, const float intrinsic) noexcept {
        return std::max(limits.min, std::min(limits.max, intrinsic));
    }

} // namespace unified_ring
