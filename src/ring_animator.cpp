#include "unified_ring/anim/ring_animator.hpp"

#include <algorithm>
#include <cmath>
#include <log.h>
#include <utility>

namespace unified_ring {

    namespace {

        // Trailing sliver kept visible when a wide arc collapses in indeterminate mode
        constexpr float wrap_sliver = 0.05f;

        // Upper bound on the time fraction at which a determinate wrap closes the arc,
        // so the fill leg never has zero length
        constexpr float max_close_fraction = 0.99f;

        [[nodiscard]] ring_angles rebased(ring_angles a) noexcept {
            if (a.start >= 1.0f || a.start < 0.0f) {
                const float whole = std::floor(a.start);
                a.start -= whole;
                a.end   -= whole;
            }
            return a;
        }

        [[nodiscard]] int scaled_duration(const int base_ms, const float revolutions) noexcept {
            return static_cast<int>(static_cast<float>(base_ms) * revolutions);
        }

        [[nodiscard]] const char *to_string(const plan_kind kind) noexcept {
            switch (kind) {
                case plan_kind::indeterminate_sweep:
                    return "indeterminate sweep";
                case plan_kind::indeterminate_wrap:
                    return "indeterminate wrap";
                case plan_kind::determinate_fill:
                    return "determinate fill";
                case plan_kind::determinate_wrap:
                    return "determinate wrap";
            }
            return "unknown";
        }

    } // namespace

    ring_angles reduce(ring_angles angles) noexcept {
        if (angles.end < angles.start) angles.end = angles.start;
        if (angles.end > angles.start + 1.0f) angles.end = angles.start + 1.0f;
        return rebased(angles);
    }

    ring_animator::ring_animator(const ring_config cfg) :
        ring_animator(cfg, std::make_unique<keyframe_timeline>(), std::make_unique<keyframe_timeline>()) {}

    ring_animator::ring_animator(const ring_config cfg, std::unique_ptr<timeline> start_track,
                                 std::unique_ptr<timeline> end_track) :
        config_(cfg), start_track_(std::move(start_track)), end_track_(std::move(end_track)) {
        build_indeterminate_plan();
    }

    void ring_animator::set_indeterminate(const bool indeterminate) {
        if (!indeterminate) {
            if (mode_ == ring_mode::indeterminate) set_progress(progress_);
            return;
        }
        if (mode_ == ring_mode::indeterminate) return;

        mode_   = ring_mode::indeterminate;
        angles_ = reduce(angles_);
        if (angles_.start < angular_epsilon) {
            build_indeterminate_plan();
        } else {
            Log::debug("Ring", "indeterminate switch deferred until the sweep ends (start=", angles_.start, ")");
        }
    }

    void ring_animator::set_progress(const float fraction) {
        progress_ = std::isnan(fraction) ? 0.0f : std::clamp(fraction, 0.0f, 1.0f);
        mode_     = ring_mode::determinate;
        build_determinate_plan();
    }

    bool ring_animator::tick(const float elapsed_ms) {
        const bool start_was_running = start_track_->is_running();
        if (!start_was_running && !end_track_->is_running()) return false;

        start_track_->advance(elapsed_ms);
        end_track_->advance(elapsed_ms);
        read_tracks();

        // Natural end of a cycle: re-arm here rather than from inside the timeline
        if (start_was_running && start_track_->finished() && mode_ == ring_mode::indeterminate && started_) {
            build_indeterminate_plan();
        }
        return true;
    }

    void ring_animator::start() {
        if (is_running()) return;
        if (mode_ == ring_mode::indeterminate) {
            build_indeterminate_plan();
        } else {
            build_determinate_plan();
        }
    }

    void ring_animator::stop() {
        started_ = false;
        start_track_->end();
        end_track_->end();
        read_tracks();
    }

    void ring_animator::set_duration(const int duration_ms) {
        if (duration_ms <= 0) {
            Log::warning("Ring", "ignoring non-positive duration ", duration_ms, "ms; keeping ",
                         config_.duration_ms, "ms");
            return;
        }
        config_.duration_ms = duration_ms;
    }

    void ring_animator::build_determinate_plan() {
        angles_ = reduce(angles_);
        const auto [start, end] = angles_;

        if (start < angular_epsilon && end <= progress_) {
            install({
                .kind        = plan_kind::determinate_fill,
                .start       = {{0.0f, start}, {1.0f, 0.0f}},
                .end         = {{0.0f, end}, {1.0f, progress_}},
                .duration_ms = scaled_duration(config_.duration_ms, progress_ - end),
            });
            return;
        }

        const float next          = std::ceil(end);
        const float time_to_reset = next - start;
        const float total         = time_to_reset + progress_;
        const float close_at      = total > 0.0f ? std::min(time_to_reset / total, max_close_fraction)
                                                 : max_close_fraction;

        install({
            .kind        = plan_kind::determinate_wrap,
            .start       = {{0.0f, start}, {close_at, next}, {1.0f, next}},
            .end         = {{0.0f, end}, {close_at, next}, {1.0f, next + progress_}},
            .duration_ms = scaled_duration(config_.duration_ms, total),
        });
    }

    void ring_animator::build_indeterminate_plan() {
        angles_ = reduce(angles_);
        const auto [start, end] = angles_;

        const float span  = end - start;
        const bool  small = config_.threshold_inclusive ? span <= config_.small_arc_threshold
                                                        : span < config_.small_arc_threshold;
        if (small) {
            const float base = start < angular_epsilon ? 0.0f : start;
            install({
                .kind  = plan_kind::indeterminate_sweep,
                .start = {{0.0f, start}, {0.5f, base + 0.2f}, {0.7f, base + 0.8f}, {1.0f, base + 1.2f}},
                .end   = {{0.0f, end}, {0.2f, base + 0.65f}, {0.5f, base + 1.05f}, {1.0f, base + 1.25f}},
                .duration_ms = config_.duration_ms,
            });
            return;
        }

        const float next = std::ceil(end);
        install({
            .kind        = plan_kind::indeterminate_wrap,
            .start       = {{0.0f, start}, {1.0f, next}},
            .end         = {{0.0f, end}, {1.0f, next + wrap_sliver}},
            .duration_ms = scaled_duration(config_.duration_ms, next - start),
        });
    }

    void ring_animator::install(ring_plan plan) {
        start_track_->cancel();
        end_track_->cancel();

        plan_ = std::move(plan);
        Log::debug("Ring", to_string(plan_.kind), " plan over ", plan_.duration_ms, "ms");

        start_track_->start(plan_.start, plan_.duration_ms);
        end_track_->start(plan_.end, plan_.duration_ms);
        started_ = true;
    }

    void ring_animator::read_tracks() noexcept {
        angles_ = rebased({start_track_->value(), end_track_->value()});
    }

} // namespace unified_ring
