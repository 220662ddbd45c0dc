#include "unified_ring/anim/timeline.hpp"

#include <utility>

namespace unified_ring {

    void keyframe_timeline::start(keyframe_curve curve, const int duration_ms) {
        curve_       = std::move(curve);
        duration_ms_ = duration_ms;
        elapsed_ms_  = 0.0f;
        value_       = curve_.front_value();
        running_     = true;
        finished_    = false;
    }

    void keyframe_timeline::cancel() {
        running_ = false;
    }

    void keyframe_timeline::end() {
        if (!running_) return;
        elapsed_ms_ = static_cast<float>(duration_ms_);
        value_      = curve_.back_value();
        running_    = false;
        finished_   = true;
    }

    float keyframe_timeline::advance(const float elapsed_ms) {
        if (!running_) return value_;

        elapsed_ms_ += elapsed_ms > 0.0f ? elapsed_ms : 0.0f;
        if (duration_ms_ <= 0 || elapsed_ms_ >= static_cast<float>(duration_ms_)) {
            end();
            return value_;
        }

        value_ = curve_.evaluate(elapsed_ms_ / static_cast<float>(duration_ms_));
        return value_;
    }

} // namespace unified_ring
