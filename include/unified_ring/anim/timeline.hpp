/// @file timeline.hpp
/// @brief Timeline capability driving one animated value, plus the keyframe implementation.
///
/// A timeline is advanced explicitly by its owner; nothing runs on its own.
/// Completion is observable through finished() rather than a callback, so the
/// owner decides what happens next from inside its own update step.
#pragma once

#include "unified_ring/anim/keyframe.hpp"

namespace unified_ring {

    /// @brief One animated float driven by elapsed time.
    class timeline {
    public:
        virtual ~timeline() = default;

        /// @brief Replace the curve and start from its first keyframe.
        virtual void start(keyframe_curve curve, int duration_ms) = 0;

        /// @brief Stop where it is. finished() stays false.
        virtual void cancel() = 0;

        /// @brief Jump to the final keyframe and stop. finished() becomes true.
        virtual void end() = 0;

        /// @brief Move forward by @p elapsed_ms and return the new value.
        virtual float advance(float elapsed_ms) = 0;

        [[nodiscard]] virtual bool  is_running() const = 0;
        [[nodiscard]] virtual bool  finished() const   = 0;
        [[nodiscard]] virtual float value() const      = 0;
    };

    /// @brief Linear keyframe timeline. A duration <= 0 completes on the first advance.
    class keyframe_timeline : public timeline {
    public:
        void  start(keyframe_curve curve, int duration_ms) override;
        void  cancel() override;
        void  end() override;
        float advance(float elapsed_ms) override;

        [[nodiscard]] bool  is_running() const override { return running_; }
        [[nodiscard]] bool  finished() const override { return finished_; }
        [[nodiscard]] float value() const override { return value_; }

        [[nodiscard]] const keyframe_curve &curve() const noexcept { return curve_; }
        [[nodiscard]] int                   duration_ms() const noexcept { return duration_ms_; }
        [[nodiscard]] float                 elapsed_ms() const noexcept { return elapsed_ms_; }

    protected:
        keyframe_curve curve_;
        int            duration_ms_ = 0;
        float          elapsed_ms_  = 0.0f;
        float          value_       = 0.0f;
        bool           running_     = false;
        bool           finished_    = false;
    };

} // namespace unified_ring
