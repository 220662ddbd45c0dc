/// @file ring_animator.hpp
/// @brief Frame-by-frame start/end angles of a circular progress arc.
///
/// The ring blends an endless indeterminate sweep with a determinate arc
/// proportional to a 0-1 fraction. Every mode or target change builds a fresh
/// keyframe plan that starts exactly at the current angles, so switching never
/// makes the arc jump.
///
/// Angles are in revolutions (1.0 = 360 degrees) and satisfy
/// start <= end <= start + 1.
///
/// Usage:
/// @code
///   unified_ring::ring_animator ring;              // indeterminate, running
///   ring.set_progress(0.4f);                       // animate to 40%
///   while (ring.is_running()) {
///       ring.tick(frame_ms);
///       const auto [start, end] = ring.angles();   // draw
///   }
///   ring.set_indeterminate(true);                  // back to the sweep
/// @endcode
///
/// Not thread-safe: call everything from one thread (see mailbox.hpp).
#pragma once

#include <cstdint>
#include <memory>

#include "unified_ring/anim/keyframe.hpp"
#include "unified_ring/anim/timeline.hpp"

namespace unified_ring {

    /// @brief Smallest angle treated as distinct from zero (one tenth of a degree).
    inline constexpr float angular_epsilon = 1.0f / 3600.0f;

    struct ring_angles {
        float start = 0.0f;
        float end   = 0.0f;

        [[nodiscard]] constexpr float span() const noexcept { return end - start; }
        [[nodiscard]] constexpr bool  operator==(const ring_angles &) const noexcept = default;
    };

    /**
     * @brief Clamp the span into [0, 1] and shift both angles so start lies in [0, 1).
     *
     * The drawn arc is unchanged.
     */
    [[nodiscard]] ring_angles reduce(ring_angles angles) noexcept;

    enum class ring_mode : std::uint8_t { indeterminate, determinate };

    /// @brief Which of the four plan shapes was built.
    enum class plan_kind : std::uint8_t {
        indeterminate_sweep, ///< small arc: grow the head, then chase with the tail
        indeterminate_wrap,  ///< wide arc: collapse to the next revolution, keeping a sliver
        determinate_fill,    ///< clean start: fill straight to the target
        determinate_wrap,    ///< close the arc at the next revolution, then fill
    };

    struct ring_plan {
        plan_kind      kind = plan_kind::indeterminate_sweep;
        keyframe_curve start;
        keyframe_curve end;
        int            duration_ms = 0;
    };

    struct ring_config {
        int   duration_ms         = 1333; ///< Base cadence of one indeterminate cycle.
        float small_arc_threshold = 0.5f; ///< Arcs up to this span sweep in place; wider ones wrap first.
        bool  threshold_inclusive = true; ///< Whether a span exactly at the threshold still sweeps in place.

        [[nodiscard]] static constexpr ring_config compact() noexcept { return {}; }
        [[nodiscard]] static constexpr ring_config relaxed() noexcept {
            return {.duration_ms = 1333, .small_arc_threshold = 0.8f, .threshold_inclusive = false};
        }

        [[nodiscard]] constexpr bool operator==(const ring_config &) const noexcept = default;
    };

    class ring_animator {
    public:
        /// @brief Indeterminate ring with keyframe timelines, started immediately.
        explicit ring_animator(ring_config cfg = {});

        /// @brief Same, with caller-provided timelines for start and end.
        ring_animator(ring_config cfg, std::unique_ptr<timeline> start_track, std::unique_ptr<timeline> end_track);

        ring_animator(const ring_animator &)            = delete;
        ring_animator &operator=(const ring_animator &) = delete;
        ring_animator(ring_animator &&)                 = delete;
        ring_animator &operator=(ring_animator &&)      = delete;
        ~ring_animator()                                = default;

        /**
         * @brief Switch between the endless sweep and the determinate arc.
         *
         * Leaving indeterminate mode animates to the last progress set. Entering
         * it from a determinate arc that does not start at zero waits for the
         * running sweep to finish before the indeterminate cycle begins.
         */
        void set_indeterminate(bool indeterminate);

        /// @brief Animate to @p fraction (clamped to [0, 1], NaN reads as 0); always starts at once.
        void set_progress(float fraction);

        /**
         * @brief Advance both timelines by @p elapsed_ms.
         *
         * When the start timeline completes in indeterminate mode the next cycle
         * is armed in the same call.
         * @return True when the angles moved and the arc needs a redraw.
         */
        bool tick(float elapsed_ms);

        /// @brief Resume from the current angles. No-op while running.
        void start();

        /// @brief Jump both timelines to their final values and stop.
        void stop();

        [[nodiscard]] bool is_running() const noexcept { return start_track_->is_running(); }

        /// @brief Current arc, re-based so start lies in [0, 1).
        [[nodiscard]] ring_angles angles() const noexcept { return angles_; }

        /// @brief Base duration for subsequent plans. Values <= 0 are rejected.
        void               set_duration(int duration_ms);
        [[nodiscard]] int  duration() const noexcept { return config_.duration_ms; }

        [[nodiscard]] bool               is_indeterminate() const noexcept { return mode_ == ring_mode::indeterminate; }
        [[nodiscard]] ring_mode          mode() const noexcept { return mode_; }
        [[nodiscard]] float              progress() const noexcept { return progress_; }
        [[nodiscard]] const ring_plan   &plan() const noexcept { return plan_; }
        [[nodiscard]] const ring_config &config() const noexcept { return config_; }

    private:
        void build_indeterminate_plan();
        void build_determinate_plan();
        void install(ring_plan plan);
        void read_tracks() noexcept;

        ring_config               config_;
        std::unique_ptr<timeline> start_track_;
        std::unique_ptr<timeline> end_track_;
        ring_plan                 plan_;
        ring_angles               angles_;
        ring_mode                 mode_     = ring_mode::indeterminate;
        float                     progress_ = 0.0f;
        bool                      started_  = false;
    };

} // namespace unified_ring
