#include "unified_ring/widgets/progress_ring.hpp"

#include <algorithm>
#include <cmath>
#include <log.h>
#include <numbers>

#include "unified_ring/core/raii.hpp"

namespace unified_ring {

    namespace {

        template<typename... Fs>
        struct overloaded : Fs... {
            using Fs::operator()...;
        };

        constexpr float deg_to_rad = std::numbers::pi_v<float> / 180.0f;

        // Sweeps smaller than this draw nothing
        constexpr float min_visible_sweep_deg = 360.0f * angular_epsilon;

        [[nodiscard]] ImVec4 resolve_tint(const ImVec4 &tint, const float alpha) noexcept {
            ImVec4 col = tint.w == 0.0f ? ImGui::GetStyle().Colors[ImGuiCol_ButtonActive] : tint;
            col.w *= alpha;
            return col;
        }

    } // namespace

    progress_ring::progress_ring(const ring_config cfg) : animator_(cfg) {}

    // ============================================================================
    // Mode and progress
    // ============================================================================

    void progress_ring::set_indeterminate(const bool indeterminate) {
        if (!context_.is_current()) {
            pending_.post(mode_update{indeterminate});
            return;
        }
        apply_indeterminate(indeterminate);
    }

    void progress_ring::set_progress(const int progress) {
        if (!context_.is_current()) {
            pending_.post(progress_update{progress});
            return;
        }
        apply_progress(progress);
    }

    void progress_ring::increment_progress_by(const int diff) {
        // Resolved against progress_ on the owner thread so concurrent increments add up
        if (!context_.is_current()) {
            pending_.post(increment_update{diff});
            return;
        }
        apply_progress(progress_ + diff);
    }

    void progress_ring::set_min(const int min) {
        if (!context_.is_current()) {
            pending_.post(min_update{min});
            return;
        }
        apply_min(min);
    }

    void progress_ring::set_max(const int max) {
        if (!context_.is_current()) {
            pending_.post(max_update{max});
            return;
        }
        apply_max(max);
    }

    float progress_ring::fraction() const noexcept {
        const int range = max_ - min_;
        if (range <= 0) return 0.0f;
        return static_cast<float>(progress_ - min_) / static_cast<float>(range);
    }

    void progress_ring::apply(const update_msg &msg) {
        std::visit(overloaded{
                       [this](const progress_update &u) { apply_progress(u.value); },
                       [this](const increment_update &u) { apply_progress(progress_ + u.diff); },
                       [this](const mode_update &u) { apply_indeterminate(u.indeterminate); },
                       [this](const min_update &u) { apply_min(u.value); },
                       [this](const max_update &u) { apply_max(u.value); },
                   },
                   msg);
    }

    void progress_ring::apply_progress(const int progress) {
        const int clamped = std::clamp(progress, min_, max_);
        if (clamped == progress_ && !indeterminate_) return;

        progress_      = clamped;
        indeterminate_ = false;
        refresh_progress();
    }

    void progress_ring::apply_indeterminate(const bool indeterminate) {
        indeterminate_ = indeterminate;
        if (indeterminate) {
            animator_.set_indeterminate(true);
        } else if (animator_.is_indeterminate()) {
            animator_.set_progress(fraction());
        }
        start_animation();
    }

    void progress_ring::apply_min(int min) {
        min = std::min(min, max_);
        if (min == min_) return;

        min_ = min;
        if (progress_ < min_) progress_ = min_;
        // The range only shows while determinate; an indeterminate ring picks it up when it leaves the sweep
        if (!indeterminate_) refresh_progress();
    }

    void progress_ring::apply_max(int max) {
        max = std::max(max, min_);
        if (max == max_) return;

        max_ = max;
        if (progress_ > max_) progress_ = max_;
        if (!indeterminate_) refresh_progress();
    }

    void progress_ring::refresh_progress() {
        animator_.set_progress(fraction());
        start_animation();
    }

    // ============================================================================
    // Lifecycle
    // ============================================================================

    void progress_ring::attach() {
        start_animation();
        drain_updates();
        attached_ = true;
        Log::debug("Ring", "attached; ", indeterminate_ ? "indeterminate" : "determinate");
    }

    void progress_ring::detach() {
        stop_animation();
        attached_ = false;
        Log::debug("Ring", "detached with ", pending_.size(), " queued update(s)");
    }

    void progress_ring::set_visible(const bool visible) {
        if (visible == visible_) return;
        visible_ = visible;
        if (visible_) {
            start_animation();
        } else {
            stop_animation();
        }
    }

    bool progress_ring::is_animating() const noexcept {
        return animator_.is_running() && attached_ && visible_;
    }

    void progress_ring::drain_updates() {
        pending_.drain([this](update_msg &&msg) { apply(msg); });
    }

    void progress_ring::start_animation() noexcept {
        if (!visible_) return;
        start_requested_ = true;
    }

    void progress_ring::stop_animation() {
        animator_.stop();
        start_requested_ = false;
    }

    bool progress_ring::update(const float elapsed_ms) {
        if (!context_.is_current()) {
            Log::warning("Ring", "update() called off the owning thread; ignored");
            return false;
        }
        if (!attached_) return false;

        drain_updates();
        if (!visible_) return false;

        const bool moved = animator_.tick(elapsed_ms);
        if (start_requested_) {
            start_requested_ = false;
            animator_.start();
        }
        return moved;
    }

    // ============================================================================
    // Drawing
    // ============================================================================

    void progress_ring::set_alpha(const float alpha) noexcept {
        alpha_ = std::clamp(alpha, 0.0f, 1.0f);
    }

    float progress_ring::measured_size() const noexcept {
        return measure(limits_, ring_metrics::intrinsic_size);
    }

    void progress_ring::render(const char *label, const float side) {
        update(ImGui::GetIO().DeltaTime * 1000.0f);

        const float  size = side > 0.0f ? side : measured_size();
        const ImVec2 pos  = ImGui::GetCursorScreenPos();
        {
            const id scope{this};
            ImGui::InvisibleButton(label, {size, size});
        }

        const ring_box box = fit_square(size, size, mirrored());
        if (box.width() <= 0.0f) return;

        const float  scale  = box.width() / ring_metrics::intrinsic_size;
        const ImVec2 center = {pos.x + (box.left + box.right) * 0.5f, pos.y + (box.top + box.bottom) * 0.5f};

        const arc_degrees arc = arc_for(animator_.angles(), mirrored());
        if (std::abs(arc.sweep_deg) < min_visible_sweep_deg) return;

        const float a_min = arc.start_deg * deg_to_rad;
        const float a_max = (arc.start_deg + arc.sweep_deg) * deg_to_rad;

        ImDrawList *dl = ImGui::GetWindowDrawList();
        dl->PathClear();
        dl->PathArcTo(center, ring_metrics::progress_radius * scale, a_min, a_max);
        dl->PathStroke(ImGui::ColorConvertFloat4ToU32(resolve_tint(tint_, alpha_)), ImDrawFlags_None,
                       ring_metrics::border_width * scale);
    }

    // ============================================================================
    // State
    // ============================================================================

    ring_saved_state progress_ring::save_state() const noexcept {
        return {.progress = progress_, .indeterminate = indeterminate_};
    }

    void progress_ring::restore_state(const ring_saved_state &state) {
        set_progress(state.progress);
        set_indeterminate(state.indeterminate);
    }

} // namespace unified_ring
