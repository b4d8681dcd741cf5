#pragma once

#include <cadence/clip.hpp>
#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cadence
{

// Rewrites `specs` back-to-back: the first keeps its start, every next one
// starts one frame after the previous end, each keeps max(0, end - start) as
// its span, and all share `lane_id`.
std::vector<ClipSpec> layout_serial(std::vector<ClipSpec> specs, const std::string& lane_id);

// SceneTree — arena of clip declarations.
//
// Nodes are addressed by a stable index that doubles as their ClipId. Nodes
// never point at their children's data or the other way round; each stores
// its own resolved absolute interval, computed when it enters.
//
// enter()/exit() stand in for mount/unmount: entering resolves a node (and its
// subtree) against the parent's interval and registers every node with a
// non-empty span; exiting deregisters the subtree.
//
// Not thread-safe; owned by the thread that composes the timeline.
class SceneTree
{
   public:
    using NodeIndex = ClipId;

    // Parent index for top-level clips.
    static constexpr NodeIndex kRoot = INVALID_CLIP_ID;

    explicit SceneTree(ClipRegistry& registry);
    ~SceneTree();

    SceneTree(const SceneTree&)            = delete;
    SceneTree& operator=(const SceneTree&) = delete;

    // ─── Declaration ─────────────────────────────────────────────────────

    NodeIndex              add_clip(NodeIndex parent, ClipSpec spec);
    std::vector<NodeIndex> add_serial(NodeIndex parent, std::vector<ClipSpec> specs);

    // ─── Lifecycle ───────────────────────────────────────────────────────

    // Enters `index` and its subtree. Returns false when the node is unknown or
    // its parent has not entered yet.
    bool enter(NodeIndex index);

    // Exits `index` and its subtree. No-op for nodes that are not entered.
    void exit(NodeIndex index);

    // Remount with new props: exit, replace the spec, enter again if it was entered.
    void update(NodeIndex index, ClipSpec spec);

    void enter_all();
    void exit_all();

    // ─── Time context ────────────────────────────────────────────────────

    // Frozen subtrees read `snapshot` instead of following the store.
    void freeze(NodeIndex index, Frame snapshot);
    void thaw(NodeIndex index);

    // Context whose origin is the node's absolute start.
    TimeContext time_context(NodeIndex index) const;

    // ─── Queries ─────────────────────────────────────────────────────────

    bool                        contains(NodeIndex index) const;
    bool                        entered(NodeIndex index) const;
    bool                        has_span(NodeIndex index) const;
    std::optional<ClipInterval> interval(NodeIndex index) const;
    int                         depth(NodeIndex index) const;
    std::optional<NodeIndex>    parent(NodeIndex index) const;
    std::vector<NodeIndex>      children(NodeIndex index) const;
    const ClipSpec*             spec(NodeIndex index) const;
    size_t                      size() const { return nodes_.size(); }

    // has_span && frame within the interval && effectively visible.
    bool is_active(NodeIndex index, Frame global_frame, const VisibilityState& visibility) const;

   private:
    struct Node
    {
        ClipSpec               spec;
        NodeIndex              parent = kRoot;
        std::vector<NodeIndex> children;

        bool  entered  = false;
        bool  has_span = false;
        Frame base_start = 0;   // clamped bounds handed down to children
        Frame base_end   = 0;
        int   depth      = 0;

        bool  frozen          = false;
        Frame frozen_snapshot = 0;
    };

    void enter_node(NodeIndex index);
    void exit_node(NodeIndex index);

    ClipRegistry&     registry_;
    std::vector<Node> nodes_;
    uint64_t          next_serial_ = 1;
};

}   // namespace cadence
