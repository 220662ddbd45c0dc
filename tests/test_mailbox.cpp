#include <cstddef>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unified_ring/core/mailbox.hpp>
#include <vector>

using namespace unified_ring;

// --- execution_context ---

TEST(ExecutionContext, CurrentOnConstructingThread) {
    const execution_context ctx;
    EXPECT_TRUE(ctx.is_current());
    EXPECT_EQ(ctx.owner(), std::this_thread::get_id());
}

TEST(ExecutionContext, NotCurrentElsewhere) {
    const execution_context ctx;
    bool                    current = true;
    std::thread([&] { current = ctx.is_current(); }).join();
    EXPECT_FALSE(current);
}

TEST(ExecutionContext, RebindMovesOwnership) {
    execution_context ctx;
    std::thread([&] { ctx.rebind(); }).join();
    EXPECT_FALSE(ctx.is_current());
    ctx.rebind();
    EXPECT_TRUE(ctx.is_current());
}

// --- mailbox ---

TEST(Mailbox, DrainsInArrivalOrder) {
    mailbox<std::string> box;
    box.post("a");
    box.post("b");
    box.post("c");
    EXPECT_EQ(box.size(), 3u);

    std::vector<std::string> seen;
    EXPECT_EQ(box.drain([&](std::string &&s) { seen.push_back(std::move(s)); }), 3u);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(box.empty());
}

TEST(Mailbox, DrainOnEmptyIsNoop) {
    mailbox<int> box;
    int          calls = 0;
    EXPECT_EQ(box.drain([&](int &&) { ++calls; }), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(Mailbox, PostDuringDrainWaitsForNextDrain) {
    mailbox<int>     box;
    std::vector<int> seen;
    box.post(1);
    box.drain([&](int &&v) {
        seen.push_back(v);
        box.post(v + 1);
    });
    EXPECT_EQ(seen, std::vector<int>{1});
    EXPECT_EQ(box.size(), 1u);

    box.drain([&](int &&v) { seen.push_back(v); });
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(Mailbox, ClearDropsPending) {
    mailbox<int> box;
    box.post(7);
    box.clear();
    EXPECT_TRUE(box.empty());
}

TEST(Mailbox, ConcurrentPostersAllDelivered) {
    mailbox<int>             box;
    constexpr int            per_thread = 500;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&box, w] {
            for (int i = 0; i < per_thread; ++i) box.post(w * per_thread + i);
        });
    }
    for (auto &t: workers) t.join();

    // Each worker's own posts stay in order
    std::vector<int> last(4, -1);
    bool             ordered = true;
    const size_t     n       = box.drain([&](int &&v) {
        const int w = v / per_thread;
        if (v <= last[w]) ordered = false;
        last[w] = v;
    });
    EXPECT_EQ(n, 4u * per_thread);
    EXPECT_TRUE(ordered);
}
