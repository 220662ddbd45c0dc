#include <gtest/gtest.h>
#include <thread>
#include <unified_ring/widgets/progress_ring.hpp>

using namespace unified_ring;

namespace {

    constexpr float frame_ms = 16.0f;

    void run_frames(progress_ring &ring, const int frames) {
        for (int i = 0; i < frames; ++i) ring.update(frame_ms);
    }

    bool same_plan(const ring_plan &a, const ring_plan &b) {
        return a.kind == b.kind && a.start == b.start && a.end == b.end && a.duration_ms == b.duration_ms;
    }

} // namespace

// --- defaults ---

TEST(ProgressRing, Defaults) {
    const progress_ring ring;
    EXPECT_EQ(ring.min(), 0);
    EXPECT_EQ(ring.max(), 100);
    EXPECT_EQ(ring.progress(), 0);
    EXPECT_TRUE(ring.is_indeterminate());
    EXPECT_FALSE(ring.attached());
    EXPECT_TRUE(ring.visible());
    EXPECT_FALSE(ring.is_animating());
    EXPECT_FALSE(ring.mirrored());
    EXPECT_FLOAT_EQ(ring.alpha(), 1.0f);
    EXPECT_EQ(ring.pending_updates(), 0u);
}

// --- progress and range ---

TEST(ProgressRing, SetProgressLeavesIndeterminate) {
    progress_ring ring;
    ring.set_progress(42);
    EXPECT_FALSE(ring.is_indeterminate());
    EXPECT_EQ(ring.progress(), 42);
    EXPECT_FLOAT_EQ(ring.fraction(), 0.42f);
    EXPECT_FALSE(ring.animator().is_indeterminate());
    EXPECT_FLOAT_EQ(ring.animator().progress(), 0.42f);
}

TEST(ProgressRing, ProgressIsClampedToRange) {
    progress_ring ring;
    ring.set_progress(150);
    EXPECT_EQ(ring.progress(), 100);
    ring.set_progress(-5);
    EXPECT_EQ(ring.progress(), 0);
}

TEST(ProgressRing, RepeatedProgressDoesNotRestartTheArc) {
    progress_ring ring;
    ring.set_progress(30);
    ring.animator().tick(frame_ms);
    const ring_plan before = ring.animator().plan();

    ring.set_progress(30);
    EXPECT_TRUE(same_plan(ring.animator().plan(), before));
}

TEST(ProgressRing, IncrementProgressBy) {
    progress_ring ring;
    ring.set_progress(10);
    ring.increment_progress_by(5);
    EXPECT_EQ(ring.progress(), 15);
    ring.increment_progress_by(200);
    EXPECT_EQ(ring.progress(), 100);
}

TEST(ProgressRing, ProgressReadsZeroWhileIndeterminate) {
    progress_ring ring;
    ring.set_progress(40);
    ring.set_indeterminate(true);
    EXPECT_EQ(ring.progress(), 0);
    EXPECT_EQ(ring.save_state().progress, 40);
}

TEST(ProgressRing, ShrinkingRangeClampsProgress) {
    progress_ring ring;
    ring.set_progress(80);
    ring.set_max(50);
    EXPECT_EQ(ring.progress(), 50);
    EXPECT_FLOAT_EQ(ring.animator().progress(), 1.0f);

    ring.set_min(60);
    EXPECT_EQ(ring.min(), 50);
}

TEST(ProgressRing, BoundsCannotCross) {
    progress_ring ring;
    ring.set_max(-5);
    EXPECT_EQ(ring.max(), 0);
    ring.set_max(100);
    ring.set_min(150);
    EXPECT_EQ(ring.min(), 100);
}

TEST(ProgressRing, EmptyRangeMapsToZero) {
    progress_ring ring;
    ring.set_max(0);
    EXPECT_FLOAT_EQ(ring.fraction(), 0.0f);
}

TEST(ProgressRing, RangeChangeWhileIndeterminateAppliesOnLeaving) {
    progress_ring ring;
    ring.set_progress(40);
    ring.set_indeterminate(true);
    ring.set_max(200);
    EXPECT_TRUE(ring.animator().is_indeterminate());

    ring.set_indeterminate(false);
    EXPECT_EQ(ring.progress(), 40);
    EXPECT_FLOAT_EQ(ring.fraction(), 0.2f);
    EXPECT_FLOAT_EQ(ring.animator().progress(), 0.2f);
}

TEST(ProgressRing, ArcSettlesOnProgress) {
    progress_ring ring;
    ring.attach();
    ring.set_progress(50);
    run_frames(ring, 200);
    EXPECT_NEAR(ring.animator().angles().start, 0.0f, 1e-4f);
    EXPECT_NEAR(ring.animator().angles().end, 0.5f, 1e-4f);
}

// --- threading ---

TEST(ProgressRing, OffThreadCallsWaitForAttach) {
    progress_ring ring;
    std::thread([&] {
        ring.set_progress(70);
        ring.set_indeterminate(true);
    }).join();

    EXPECT_EQ(ring.pending_updates(), 2u);
    EXPECT_EQ(ring.save_state().progress, 0);

    ring.attach();
    EXPECT_EQ(ring.pending_updates(), 0u);
    EXPECT_TRUE(ring.is_indeterminate());
    EXPECT_EQ(ring.save_state().progress, 70);
}

TEST(ProgressRing, OffThreadCallsApplyOnUpdate) {
    progress_ring ring;
    ring.attach();
    std::thread([&] { ring.set_progress(25); }).join();
    EXPECT_EQ(ring.pending_updates(), 1u);

    ring.update(frame_ms);
    EXPECT_EQ(ring.pending_updates(), 0u);
    EXPECT_EQ(ring.progress(), 25);
}

TEST(ProgressRing, OffThreadIncrementsAccumulate) {
    progress_ring ring;
    ring.set_progress(10);
    std::thread([&] {
        ring.increment_progress_by(5);
        ring.increment_progress_by(5);
    }).join();
    EXPECT_EQ(ring.pending_updates(), 2u);

    ring.attach();
    EXPECT_EQ(ring.progress(), 20);
}

TEST(ProgressRing, OffThreadIncrementAppliesAfterQueuedProgress) {
    progress_ring ring;
    ring.attach();
    std::thread([&] {
        ring.set_progress(40);
        ring.increment_progress_by(-15);
    }).join();

    ring.update(frame_ms);
    EXPECT_EQ(ring.progress(), 25);
}

TEST(ProgressRing, DetachedRingKeepsUpdatesQueued) {
    progress_ring ring;
    std::thread([&] { ring.set_max(10); }).join();
    EXPECT_FALSE(ring.update(frame_ms));
    EXPECT_EQ(ring.pending_updates(), 1u);
    EXPECT_EQ(ring.max(), 100);
}

TEST(ProgressRing, UpdateOffOwnerThreadIsIgnored) {
    progress_ring ring;
    ring.attach();
    bool moved = true;
    std::thread([&] { moved = ring.update(frame_ms); }).join();
    EXPECT_FALSE(moved);
}

// --- lifecycle ---

TEST(ProgressRing, AttachedRingAnimates) {
    progress_ring ring;
    ring.attach();
    EXPECT_TRUE(ring.is_animating());
    EXPECT_TRUE(ring.update(frame_ms));
}

TEST(ProgressRing, DetachStopsAndAttachResumes) {
    progress_ring ring;
    ring.attach();
    run_frames(ring, 5);

    ring.detach();
    EXPECT_FALSE(ring.animator().is_running());
    EXPECT_FALSE(ring.is_animating());

    ring.attach();
    ring.update(frame_ms);
    EXPECT_TRUE(ring.animator().is_running());
    EXPECT_TRUE(ring.is_animating());
}

TEST(ProgressRing, HiddenRingDoesNotAnimate) {
    progress_ring ring;
    ring.attach();
    ring.set_visible(false);
    EXPECT_FALSE(ring.is_animating());
    EXPECT_FALSE(ring.update(frame_ms));

    ring.set_visible(true);
    ring.update(frame_ms);
    EXPECT_TRUE(ring.is_animating());
}

// --- appearance ---

TEST(ProgressRing, MirrorsOnlyWhenBothFlagsSet) {
    progress_ring ring;
    ring.set_mirror_for_rtl(true);
    EXPECT_FALSE(ring.mirrored());
    ring.set_layout_rtl(true);
    EXPECT_TRUE(ring.mirrored());
    ring.set_mirror_for_rtl(false);
    EXPECT_FALSE(ring.mirrored());
}

TEST(ProgressRing, AlphaIsClamped) {
    progress_ring ring;
    ring.set_alpha(1.5f);
    EXPECT_FLOAT_EQ(ring.alpha(), 1.0f);
    ring.set_alpha(-0.5f);
    EXPECT_FLOAT_EQ(ring.alpha(), 0.0f);
}

TEST(ProgressRing, MeasuredSizeRespectsLimits) {
    progress_ring ring;
    EXPECT_FLOAT_EQ(ring.measured_size(), 48.0f);
    ring.set_size_limits({.min = 24.0f, .max = 32.0f});
    EXPECT_FLOAT_EQ(ring.measured_size(), 32.0f);
}

// --- state ---

TEST(ProgressRing, RestoreDeterminateState) {
    progress_ring ring;
    ring.restore_state({.progress = 55, .indeterminate = false});
    EXPECT_EQ(ring.progress(), 55);
    EXPECT_FALSE(ring.is_indeterminate());
}

TEST(ProgressRing, RestoreIndeterminateStateKeepsProgress) {
    progress_ring ring;
    ring.restore_state({.progress = 10, .indeterminate = true});
    EXPECT_TRUE(ring.is_indeterminate());
    EXPECT_EQ(ring.save_state(), (ring_saved_state{.progress = 10, .indeterminate = true}));
}
