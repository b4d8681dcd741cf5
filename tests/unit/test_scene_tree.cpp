#include <cadence/clip_registry.hpp>
#include <cadence/scene_tree.hpp>
#include <cadence/visibility.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace cadence;

// ─── Interval resolution ─────────────────────────────────────────────────────

TEST(ClipInterval, ResolveAgainstParent)
{
    auto iv = resolve_clip_interval(10, 200, 0, 29);
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(iv->start, 10);
    EXPECT_EQ(iv->end, 39);
}

TEST(ClipInterval, ClampsToParentBounds)
{
    auto iv = resolve_clip_interval(10, 50, -5, 100);
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(iv->start, 10);
    EXPECT_EQ(iv->end, 50);
}

TEST(ClipInterval, EmptyIntersectionIsNullopt)
{
    EXPECT_FALSE(resolve_clip_interval(10, 200, 300, 400).has_value());
    EXPECT_FALSE(resolve_clip_interval(10, 200, 5, 4).has_value());
}

TEST(ClipInterval, ExtremeBoundsSaturate)
{
    constexpr Frame kHuge = std::numeric_limits<Frame>::max();

    auto iv = resolve_clip_interval(100, kMaxFrame, kHuge - 1, kHuge);
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(iv->start, kMaxFrame);
    EXPECT_EQ(iv->end, kMaxFrame);

    iv = resolve_clip_interval(100, 500, std::numeric_limits<Frame>::min(), 10);
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(iv->start, 100);
    EXPECT_EQ(iv->end, 110);
}

// ─── Nesting ─────────────────────────────────────────────────────────────────

TEST(SceneTree, NestedClipResolvesToAbsoluteInterval)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {10, 200, "outer", ""});
    auto inner = tree.add_clip(outer, {0, 29, "inner", ""});
    tree.enter_all();

    auto iv = tree.interval(inner);
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(iv->start, 10);
    EXPECT_EQ(iv->end, 39);

    auto info = reg.get(inner);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->start, 10);
    EXPECT_EQ(info->end, 39);
    EXPECT_EQ(info->depth, 1);
    ASSERT_TRUE(info->parent_id.has_value());
    EXPECT_EQ(*info->parent_id, outer);
}

TEST(SceneTree, ThreeLevelsAccumulateOffsets)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto a = tree.add_clip(SceneTree::kRoot, {100, 500, "a", ""});
    auto b = tree.add_clip(a, {20, 200, "b", ""});
    auto c = tree.add_clip(b, {5, 9, "c", ""});
    tree.enter_all();

    EXPECT_EQ(tree.interval(b)->start, 120);
    EXPECT_EQ(tree.interval(b)->end, 300);
    EXPECT_EQ(tree.interval(c)->start, 125);
    EXPECT_EQ(tree.interval(c)->end, 129);
    EXPECT_EQ(tree.depth(c), 2);
    EXPECT_EQ(*tree.parent(c), b);
    EXPECT_FALSE(tree.parent(a).has_value());
}

TEST(SceneTree, ChildClampedToParentEnd)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {0, 49, "outer", ""});
    auto inner = tree.add_clip(outer, {40, 100, "inner", ""});
    tree.enter_all();

    EXPECT_EQ(tree.interval(inner)->start, 40);
    EXPECT_EQ(tree.interval(inner)->end, 49);
}

TEST(SceneTree, EmptyIntersectionIsNeverRegistered)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {10, 200, "outer", ""});
    auto late  = tree.add_clip(outer, {300, 400, "late", ""});
    auto deep  = tree.add_clip(late, {0, 5, "deep", ""});
    tree.enter_all();

    EXPECT_TRUE(tree.entered(late));
    EXPECT_FALSE(tree.has_span(late));
    EXPECT_FALSE(tree.interval(late).has_value());
    EXPECT_FALSE(reg.contains(late));
    EXPECT_FALSE(reg.contains(deep));
    EXPECT_EQ(reg.count(), 1u);
}

TEST(SceneTree, ExtremeSpecIsClampedBeforeRegistration)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    constexpr Frame kHuge = std::numeric_limits<Frame>::max();
    auto outer = tree.add_clip(SceneTree::kRoot, {100, kHuge, "outer", ""});
    auto inner = tree.add_clip(outer, {kHuge - 5, kHuge, "inner", ""});
    tree.enter_all();

    auto outer_info = reg.get(outer);
    ASSERT_TRUE(outer_info.has_value());
    EXPECT_EQ(outer_info->start, 100);
    EXPECT_EQ(outer_info->end, kMaxFrame);
    EXPECT_EQ(reg.max_end_exclusive(), kMaxFrame + 1);

    auto inner_info = reg.get(inner);
    ASSERT_TRUE(inner_info.has_value());
    EXPECT_EQ(inner_info->start, kMaxFrame);
    EXPECT_EQ(inner_info->end, kMaxFrame);

    tree.update(inner, {std::numeric_limits<Frame>::min(), 9, "inner", ""});
    inner_info = reg.get(inner);
    ASSERT_TRUE(inner_info.has_value());
    EXPECT_EQ(inner_info->start, 100);
    EXPECT_EQ(inner_info->end, 109);
}

TEST(SceneTree, UnknownParentAttachesToRoot)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto orphan = tree.add_clip(1234, {5, 10, "orphan", ""});
    EXPECT_FALSE(tree.parent(orphan).has_value());
    tree.enter_all();
    EXPECT_EQ(tree.interval(orphan)->start, 5);
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

TEST(SceneTree, EnterRequiresEnteredParent)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {0, 100, "outer", ""});
    auto inner = tree.add_clip(outer, {0, 10, "inner", ""});

    EXPECT_FALSE(tree.enter(inner));
    EXPECT_FALSE(reg.contains(inner));
    EXPECT_TRUE(tree.enter(outer));
    EXPECT_TRUE(reg.contains(inner));
    EXPECT_FALSE(tree.enter(999));
}

TEST(SceneTree, ExitRemovesSubtree)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {0, 100, "outer", ""});
    auto inner = tree.add_clip(outer, {0, 10, "inner", ""});
    auto other = tree.add_clip(SceneTree::kRoot, {0, 5, "other", ""});
    tree.enter_all();
    ASSERT_EQ(reg.count(), 3u);

    tree.exit(outer);
    EXPECT_FALSE(reg.contains(outer));
    EXPECT_FALSE(reg.contains(inner));
    EXPECT_TRUE(reg.contains(other));
    EXPECT_FALSE(tree.entered(inner));

    // Exiting twice is harmless.
    tree.exit(outer);
    EXPECT_EQ(reg.count(), 1u);
}

TEST(SceneTree, UpdateRemountsWithNewBounds)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {0, 100, "outer", ""});
    auto inner = tree.add_clip(outer, {10, 20, "inner", ""});
    tree.enter_all();

    tree.update(outer, {50, 150, "outer", ""});
    EXPECT_EQ(reg.get(outer)->start, 50);
    EXPECT_EQ(reg.get(inner)->start, 60);
    EXPECT_EQ(reg.get(inner)->end, 70);
}

TEST(SceneTree, UpdateOnExitedNodeStaysExited)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto clip = tree.add_clip(SceneTree::kRoot, {0, 10, "clip", ""});
    tree.update(clip, {5, 15, "clip", ""});
    EXPECT_FALSE(tree.entered(clip));
    EXPECT_FALSE(reg.contains(clip));
    EXPECT_EQ(tree.spec(clip)->start, 5);
}

TEST(SceneTree, DestructorExitsEverything)
{
    ClipRegistry reg;
    {
        SceneTree tree(reg);
        tree.add_clip(SceneTree::kRoot, {0, 10, "a", ""});
        tree.add_clip(SceneTree::kRoot, {0, 20, "b", ""});
        tree.enter_all();
        EXPECT_EQ(reg.count(), 2u);
    }
    EXPECT_EQ(reg.count(), 0u);
}

// ─── Serial ──────────────────────────────────────────────────────────────────

TEST(SceneTree, LayoutSerialPlacesBackToBack)
{
    auto out = layout_serial({{3, 12, "a", ""}, {0, 19, "b", ""}, {7, 7, "c", ""}}, "lane");
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].start, 3);
    EXPECT_EQ(out[0].end, 12);
    EXPECT_EQ(out[1].start, 13);
    EXPECT_EQ(out[1].end, 32);
    EXPECT_EQ(out[2].start, 33);
    EXPECT_EQ(out[2].end, 33);
    for (const auto& s : out)
        EXPECT_EQ(s.lane_id, "lane");
}

TEST(SceneTree, LayoutSerialSaturatesExtremeSpans)
{
    constexpr Frame kHuge = std::numeric_limits<Frame>::max();
    auto out = layout_serial(
        {{std::numeric_limits<Frame>::min(), kHuge, "a", ""}, {0, 10, "b", ""}}, "lane");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].start, -kMaxFrame);
    EXPECT_EQ(out[0].end, kMaxFrame);
    EXPECT_GT(out[1].start, out[0].end);
}

TEST(SceneTree, SerialChildrenShareLane)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {100, 1000, "outer", ""});
    auto ids   = tree.add_serial(outer, {{0, 9, "a", ""}, {0, 19, "b", ""}});
    auto more  = tree.add_serial(outer, {{0, 4, "c", ""}});
    tree.enter_all();

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(reg.get(ids[0])->start, 100);
    EXPECT_EQ(reg.get(ids[0])->end, 109);
    EXPECT_EQ(reg.get(ids[1])->start, 110);
    EXPECT_EQ(reg.get(ids[1])->end, 129);
    EXPECT_EQ(reg.get(ids[0])->lane_id, reg.get(ids[1])->lane_id);
    EXPECT_NE(reg.get(ids[0])->lane_id, reg.get(more[0])->lane_id);
}

// ─── Time context ────────────────────────────────────────────────────────────

TEST(SceneTree, TimeContextUsesClipStart)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {10, 200, "outer", ""});
    auto inner = tree.add_clip(outer, {5, 29, "inner", ""});
    tree.enter_all();

    TimeContext ctx = tree.time_context(inner);
    EXPECT_EQ(ctx.origin, 15);
    EXPECT_EQ(ctx.local(15), 0);
    EXPECT_EQ(ctx.local(40), 25);
    EXPECT_EQ(tree.time_context(outer).local(40), 30);
}

TEST(SceneTree, FrozenSubtreeReadsSnapshot)
{
    ClipRegistry reg;
    SceneTree    tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {10, 200, "outer", ""});
    auto inner = tree.add_clip(outer, {0, 100, "inner", ""});
    tree.enter_all();

    tree.freeze(outer, 50);
    EXPECT_EQ(tree.time_context(inner).local(0), 40);
    EXPECT_EQ(tree.time_context(inner).local(190), 40);

    tree.thaw(outer);
    EXPECT_EQ(tree.time_context(inner).local(190), 180);
}

// ─── Activity ────────────────────────────────────────────────────────────────

TEST(SceneTree, ActiveOnlyInsideInterval)
{
    ClipRegistry    reg;
    VisibilityState vis;
    SceneTree       tree(reg);

    auto outer = tree.add_clip(SceneTree::kRoot, {10, 200, "outer", ""});
    auto inner = tree.add_clip(outer, {0, 29, "inner", ""});
    tree.enter_all();

    EXPECT_FALSE(tree.is_active(inner, 9, vis));
    EXPECT_TRUE(tree.is_active(inner, 10, vis));
    EXPECT_TRUE(tree.is_active(inner, 39, vis));
    EXPECT_FALSE(tree.is_active(inner, 40, vis));

    vis.set_hidden(outer, true);
    EXPECT_FALSE(tree.is_active(inner, 20, vis));
}
