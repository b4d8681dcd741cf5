#include <cadence/frame_store.hpp>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace cadence;

// ─── Sanitizing ──────────────────────────────────────────────────────────────

TEST(FrameStoreSet, InitialValue)
{
    FrameStore store;
    EXPECT_EQ(store.get(), 0);

    FrameStore seeded(42);
    EXPECT_EQ(seeded.get(), 42);
}

TEST(FrameStoreSet, FloorsFractionalFrames)
{
    FrameStore store;
    store.set(12.9);
    EXPECT_EQ(store.get(), 12);
    store.set(3.0001f);
    EXPECT_EQ(store.get(), 3);
}

TEST(FrameStoreSet, ClampsNegativeToZero)
{
    FrameStore store(10);
    store.set(-5);
    EXPECT_EQ(store.get(), 0);
    store.set(7);
    store.set(-0.5);
    EXPECT_EQ(store.get(), 0);
}

TEST(FrameStoreSet, NonFiniteMapsToZero)
{
    FrameStore store(10);
    store.set(std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(store.get(), 0);
    store.set(10);
    store.set(-std::numeric_limits<double>::infinity());
    EXPECT_EQ(store.get(), 0);
}

TEST(FrameStoreSet, HugeValuesSaturate)
{
    FrameStore store;
    store.set(std::numeric_limits<double>::infinity());
    EXPECT_EQ(store.get(), 0);
    store.set(1e300);
    EXPECT_EQ(store.get(), kMaxFrame);
    store.set(std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(store.get(), kMaxFrame);
}

TEST(FrameStoreSet, ReturnsWhetherValueChanged)
{
    FrameStore store;
    EXPECT_TRUE(store.set(5));
    EXPECT_FALSE(store.set(5));
    EXPECT_FALSE(store.set(5.7));
    EXPECT_TRUE(store.set(6));
}

TEST(FrameStoreSet, CaptureSurfaceAliases)
{
    FrameStore store;
    store.set_frame(120);
    EXPECT_EQ(store.get_frame(), 120);
    store.set_frame(-3);
    EXPECT_EQ(store.get_frame(), 0);
}

// ─── Listeners ───────────────────────────────────────────────────────────────

TEST(FrameStoreListeners, FireOnlyOnChange)
{
    FrameStore         store;
    std::vector<Frame> seen;
    store.subscribe([&](Frame f) { seen.push_back(f); });

    store.set(1);
    store.set(1);
    store.set(1.5);
    store.set(2);
    store.set(-4);
    store.set(0);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], 1);
    EXPECT_EQ(seen[1], 2);
    EXPECT_EQ(seen[2], 0);
}

TEST(FrameStoreListeners, RegistrationOrder)
{
    FrameStore       store;
    std::vector<int> order;
    store.subscribe([&](Frame) { order.push_back(1); });
    store.subscribe([&](Frame) { order.push_back(2); });
    store.subscribe([&](Frame) { order.push_back(3); });

    store.set(9);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

TEST(FrameStoreListeners, SeeCommittedValue)
{
    FrameStore store;
    Frame      observed = -1;
    store.subscribe([&](Frame) { observed = store.get(); });
    store.set(33);
    EXPECT_EQ(observed, 33);
}

TEST(FrameStoreListeners, Unsubscribe)
{
    FrameStore store;
    int        calls = 0;
    auto       id    = store.subscribe([&](Frame) { ++calls; });
    EXPECT_EQ(store.listener_count(), 1u);

    store.set(1);
    store.unsubscribe(id);
    store.set(2);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(store.listener_count(), 0u);
}

TEST(FrameStoreListeners, NestedSetNeverDeliversStaleValue)
{
    FrameStore         store;
    std::vector<Frame> second_seen;

    // First listener clamps anything above 10 back to 10.
    store.subscribe(
        [&](Frame f)
        {
            if (f > 10)
                store.set(10);
        });
    store.subscribe([&](Frame f) { second_seen.push_back(f); });

    store.set(50);

    EXPECT_EQ(store.get(), 10);
    ASSERT_EQ(second_seen.size(), 1u);
    EXPECT_EQ(second_seen[0], 10);
}

TEST(FrameStoreListeners, ScopedSubscriptionUnsubscribes)
{
    FrameStore store;
    int        calls = 0;
    {
        ScopedSubscription sub(store, [&](Frame) { ++calls; });
        EXPECT_TRUE(sub.active());
        store.set(1);
    }
    store.set(2);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(store.listener_count(), 0u);
}

TEST(FrameStoreListeners, ScopedSubscriptionMove)
{
    FrameStore         store;
    int                calls = 0;
    ScopedSubscription outer;
    {
        ScopedSubscription inner(store, [&](Frame) { ++calls; });
        outer = std::move(inner);
        EXPECT_FALSE(inner.active());
    }
    store.set(3);
    EXPECT_EQ(calls, 1);
    outer.reset();
    store.set(4);
    EXPECT_EQ(calls, 1);
}

// ─── Time context ────────────────────────────────────────────────────────────

TEST(TimeContext, LocalFrameIsOffsetAndClamped)
{
    TimeContext ctx = TimeContext{}.nested(10);
    EXPECT_EQ(ctx.local(10), 0);
    EXPECT_EQ(ctx.local(25), 15);
    EXPECT_EQ(ctx.local(3), 0);
}

TEST(TimeContext, FrozenContextIgnoresGlobal)
{
    TimeContext ctx = TimeContext{}.nested(5).freeze(20);
    EXPECT_EQ(ctx.local(100), 15);
    EXPECT_EQ(ctx.local(0), 15);

    // A nested context keeps the outer snapshot.
    TimeContext inner = ctx.nested(12).freeze(999);
    EXPECT_EQ(inner.local(0), 8);
}

TEST(TimeContext, StoreReadsThroughContext)
{
    FrameStore  store(40);
    TimeContext ctx = TimeContext{}.nested(30);
    EXPECT_EQ(store.local_frame(ctx), 10);
    store.set(20);
    EXPECT_EQ(store.local_frame(ctx), 0);
}

TEST(TimeContext, SecondsToFrames)
{
    EXPECT_EQ(seconds(60.0, 1.5), 90);
    EXPECT_EQ(seconds(30.0, 0.0), 0);
    EXPECT_EQ(seconds(24.0, -2.0), 0);
}
