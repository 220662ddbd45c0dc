/// @file progress_ring.hpp
/// @brief Circular progress widget blending an indeterminate sweep with a determinate arc.
///
/// Usage:
/// @code
///   static unified_ring::progress_ring ring;      // range 0..100, indeterminate
///   ring.attach();                                // once, when the widget becomes part of the UI
///
///   // each frame:
///   ring.render("##download");
///
///   // anywhere, including worker threads:
///   ring.set_progress(42);
///   ring.set_indeterminate(true);
/// @endcode
///
/// Calls made off the thread that constructed the widget are queued and applied,
/// in order, at the next render() or attach() on that thread.
#pragma once

#include <cstddef>
#include <imgui.h>
#include <variant>

#include "unified_ring/anim/ring_animator.hpp"
#include "unified_ring/core/mailbox.hpp"
#include "unified_ring/widgets/ring_geometry.hpp"
#include "unified_ring/widgets/saved_state.hpp"

namespace unified_ring {

    class progress_ring {
    public:
        /// @brief Range 0..100, progress 0, indeterminate, visible and detached.
        explicit progress_ring(ring_config cfg = {});

        // --- Mode and progress ---

        /**
         * @brief Switch between the endless sweep and the determinate arc.
         *
         * Leaving indeterminate mode animates to the current progress.
         */
        void               set_indeterminate(bool indeterminate);
        [[nodiscard]] bool is_indeterminate() const noexcept { return indeterminate_; }

        /**
         * @brief Set progress, clamped to [min, max], and leave indeterminate mode.
         *
         * The arc animates to the new value. Setting the current value again
         * while determinate does nothing.
         */
        void set_progress(int progress);

        /// @brief Current progress, or 0 while indeterminate.
        [[nodiscard]] int progress() const noexcept { return indeterminate_ ? 0 : progress_; }

        /// @brief Add @p diff to the progress. Off-thread calls are queued and accumulate in order.
        void increment_progress_by(int diff);

        /// @brief Lower bound of the range; raised to at most max().
        void              set_min(int min);
        [[nodiscard]] int min() const noexcept { return min_; }

        /// @brief Upper bound of the range; lowered to at least min().
        void              set_max(int max);
        [[nodiscard]] int max() const noexcept { return max_; }

        /// @brief Progress mapped into [0, 1]; 0 for an empty range.
        [[nodiscard]] float fraction() const noexcept;

        // --- Lifecycle ---

        /// @brief Join the UI: apply queued updates and start animating.
        void               attach();
        /// @brief Leave the UI: stop animating. Queued updates wait for the next attach().
        void               detach();
        [[nodiscard]] bool attached() const noexcept { return attached_; }

        void               set_visible(bool visible);
        [[nodiscard]] bool visible() const noexcept { return visible_; }

        /// @brief True while the arc is moving and the widget is attached and visible.
        [[nodiscard]] bool is_animating() const noexcept;

        /**
         * @brief Apply queued updates and advance the animation without drawing.
         *
         * render() calls this with the frame delta; hosts drawing the arc
         * themselves call it once per frame.
         * @return True when the arc moved and needs a redraw.
         */
        bool update(float elapsed_ms);

        /**
         * @brief Advance by ImGui's frame delta and draw at the cursor position.
         * @param label ImGui ID label.
         * @param side  Widget side in pixels (<= 0 uses the measured size).
         */
        void render(const char *label, float side = 0.0f);

        // --- Appearance ---

        /// @brief Arc colour. Pass {0,0,0,0} (default) to use the theme's ButtonActive colour.
        void                 set_tint(const ImVec4 &tint) noexcept { tint_ = tint; }
        [[nodiscard]] ImVec4 tint() const noexcept { return tint_; }

        /// @brief Opacity multiplier in [0, 1].
        void                set_alpha(float alpha) noexcept;
        [[nodiscard]] float alpha() const noexcept { return alpha_; }

        void               set_mirror_for_rtl(const bool mirror) noexcept { mirror_for_rtl_ = mirror; }
        [[nodiscard]] bool mirror_for_rtl() const noexcept { return mirror_for_rtl_; }
        void               set_layout_rtl(const bool rtl) noexcept { layout_rtl_ = rtl; }
        [[nodiscard]] bool layout_rtl() const noexcept { return layout_rtl_; }

        /// @brief True when drawing should be flipped left-right.
        [[nodiscard]] bool mirrored() const noexcept { return mirror_for_rtl_ && layout_rtl_; }

        void                      set_size_limits(const size_limits limits) noexcept { limits_ = limits; }
        [[nodiscard]] size_limits get_size_limits() const noexcept { return limits_; }
        [[nodiscard]] float       measured_size() const noexcept;

        // --- State ---

        [[nodiscard]] ring_saved_state save_state() const noexcept;
        /// @brief Replay a saved state: progress first, then the mode.
        void                           restore_state(const ring_saved_state &state);

        [[nodiscard]] ring_animator       &animator() noexcept { return animator_; }
        [[nodiscard]] const ring_animator &animator() const noexcept { return animator_; }
        [[nodiscard]] execution_context   &context() noexcept { return context_; }
        [[nodiscard]] std::size_t          pending_updates() const { return pending_.size(); }

    private:
        struct progress_update {
            int value;
        };
        struct increment_update {
            int diff;
        };
        struct mode_update {
            bool indeterminate;
        };
        struct min_update {
            int value;
        };
        struct max_update {
            int value;
        };
        using update_msg = std::variant<progress_update, increment_update, mode_update, min_update, max_update>;

        void apply(const update_msg &msg);
        void apply_progress(int progress);
        void apply_indeterminate(bool indeterminate);
        void apply_min(int min);
        void apply_max(int max);
        void refresh_progress();
        void drain_updates();
        void start_animation() noexcept;
        void stop_animation();

        ring_animator           animator_;
        execution_context       context_;
        mailbox<update_msg>     pending_;
        int                     min_                 = 0;
        int                     max_                 = 100;
        int                     progress_            = 0;
        bool                    indeterminate_       = true;
        bool                    attached_            = false;
        bool                    visible_             = true;
        bool                    start_requested_     = false;
        bool                    mirror_for_rtl_      = false;
        bool                    layout_rtl_          = false;
        ImVec4                  tint_                = {0.0f, 0.0f, 0.0f, 0.0f};
        float                   alpha_               = 1.0f;
        size_limits             limits_;
    };

} // namespace unified_ring
