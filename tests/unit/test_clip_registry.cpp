#include <cadence/clip_registry.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace cadence;

namespace
{

ClipInfo make_clip(ClipId id, Frame start, Frame end, std::string label = "clip")
{
    ClipInfo c;
    c.id    = id;
    c.start = start;
    c.end   = end;
    c.label = std::move(label);
    return c;
}

}   // namespace

// ─── Registration ────────────────────────────────────────────────────────────

TEST(ClipRegistry, RegisterAndGet)
{
    ClipRegistry reg;
    EXPECT_TRUE(reg.register_clip(make_clip(3, 10, 39, "intro")));

    auto got = reg.get(3);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->start, 10);
    EXPECT_EQ(got->end, 39);
    EXPECT_EQ(got->label, "intro");
    EXPECT_TRUE(reg.contains(3));
    EXPECT_EQ(reg.count(), 1u);
}

TEST(ClipRegistry, RejectsInvertedInterval)
{
    ClipRegistry reg;
    EXPECT_FALSE(reg.register_clip(make_clip(1, 20, 19)));
    EXPECT_FALSE(reg.contains(1));
    EXPECT_EQ(reg.revision(), 0u);
}

TEST(ClipRegistry, RejectsBoundsOutsideFrameRange)
{
    ClipRegistry reg;
    EXPECT_FALSE(reg.register_clip(make_clip(1, 0, std::numeric_limits<Frame>::max())));
    EXPECT_FALSE(reg.register_clip(make_clip(2, std::numeric_limits<Frame>::min(), 0)));
    EXPECT_TRUE(reg.register_clip(make_clip(3, 0, kMaxFrame)));
    EXPECT_EQ(reg.count(), 1u);
    EXPECT_EQ(reg.max_end_exclusive(), kMaxFrame + 1);
}

TEST(ClipRegistry, SingleFrameClipIsValid)
{
    ClipRegistry reg;
    EXPECT_TRUE(reg.register_clip(make_clip(1, 7, 7)));
    EXPECT_EQ(reg.get(1)->interval().length(), 1);
}

TEST(ClipRegistry, ReRegisterReplacesBounds)
{
    ClipRegistry reg;
    reg.register_clip(make_clip(1, 0, 10));
    reg.register_clip(make_clip(1, 5, 20));

    EXPECT_EQ(reg.count(), 1u);
    EXPECT_EQ(reg.get(1)->start, 5);
    EXPECT_EQ(reg.get(1)->end, 20);
}

TEST(ClipRegistry, IdenticalRegistrationIsNoOp)
{
    ClipRegistry reg;
    int          changes = 0;
    reg.subscribe([&] { ++changes; });

    reg.register_clip(make_clip(1, 0, 10));
    uint64_t rev = reg.revision();
    EXPECT_TRUE(reg.register_clip(make_clip(1, 0, 10)));

    EXPECT_EQ(reg.revision(), rev);
    EXPECT_EQ(changes, 1);
}

TEST(ClipRegistry, UnregisterIsIdempotent)
{
    ClipRegistry reg;
    reg.register_clip(make_clip(1, 0, 10));
    reg.unregister_clip(1);
    uint64_t rev = reg.revision();
    reg.unregister_clip(1);
    reg.unregister_clip(99);

    EXPECT_FALSE(reg.contains(1));
    EXPECT_EQ(reg.revision(), rev);
}

// ─── Snapshot ────────────────────────────────────────────────────────────────

TEST(ClipRegistry, SnapshotKeepsRegistrationOrder)
{
    ClipRegistry reg;
    reg.register_clip(make_clip(5, 0, 1));
    reg.register_clip(make_clip(2, 0, 1));
    reg.register_clip(make_clip(9, 0, 1));
    reg.unregister_clip(2);
    reg.register_clip(make_clip(2, 0, 1));

    auto clips = reg.clips();
    ASSERT_EQ(clips.size(), 3u);
    EXPECT_EQ(clips[0].id, 5u);
    EXPECT_EQ(clips[1].id, 9u);
    EXPECT_EQ(clips[2].id, 2u);
}

TEST(ClipRegistry, MaxEndExclusive)
{
    ClipRegistry reg;
    EXPECT_EQ(reg.max_end_exclusive(), 0);
    reg.register_clip(make_clip(1, 0, 29));
    reg.register_clip(make_clip(2, 100, 149));
    EXPECT_EQ(reg.max_end_exclusive(), 150);
    reg.unregister_clip(2);
    EXPECT_EQ(reg.max_end_exclusive(), 30);
}

// ─── Listeners ───────────────────────────────────────────────────────────────

TEST(ClipRegistry, ListenersSeeEveryEffectiveChange)
{
    ClipRegistry reg;
    int          changes = 0;
    auto         id      = reg.subscribe([&] { ++changes; });

    reg.register_clip(make_clip(1, 0, 10));
    reg.register_clip(make_clip(2, 0, 10));
    reg.unregister_clip(1);
    reg.clear();
    reg.clear();
    EXPECT_EQ(changes, 4);

    reg.unsubscribe(id);
    reg.register_clip(make_clip(3, 0, 10));
    EXPECT_EQ(changes, 4);
}

TEST(ClipRegistry, ListenerMayQueryRegistry)
{
    ClipRegistry reg;
    size_t       seen = 0;
    reg.subscribe([&] { seen = reg.count(); });
    reg.register_clip(make_clip(1, 0, 10));
    EXPECT_EQ(seen, 1u);
}
