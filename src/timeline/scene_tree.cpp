#include <algorithm>
#include <cadence/clip_registry.hpp>
#include <cadence/logger.hpp>
#include <cadence/scene_tree.hpp>
#include <cadence/visibility.hpp>

namespace cadence
{

std::vector<ClipSpec> layout_serial(std::vector<ClipSpec> specs, const std::string& lane_id)
{
    if (specs.empty())
        return specs;

    Frame cursor = clamp_spec_frame(specs.front().start);
    for (auto& spec : specs)
    {
        Frame start  = clamp_spec_frame(spec.start);
        Frame span   = std::max<Frame>(0, clamp_spec_frame(spec.end) - start);
        spec.start   = cursor;
        spec.end     = clamp_spec_frame(cursor + span);
        spec.lane_id = lane_id;
        cursor       = spec.end + 1;
    }
    return specs;
}

SceneTree::SceneTree(ClipRegistry& registry) : registry_(registry) {}

SceneTree::~SceneTree()
{
    exit_all();
}

// ─── Declaration ─────────────────────────────────────────────────────────────

SceneTree::NodeIndex SceneTree::add_clip(NodeIndex parent, ClipSpec spec)
{
    if (parent != kRoot && !contains(parent))
    {
        CADENCE_LOG_WARN("timeline", "add_clip: unknown parent {}, attaching '{}' to root",
                         parent, spec.label);
        parent = kRoot;
    }

    spec.start = clamp_spec_frame(spec.start);
    spec.end   = clamp_spec_frame(spec.end);

    NodeIndex index = static_cast<NodeIndex>(nodes_.size());
    Node      node;
    node.spec   = std::move(spec);
    node.parent = parent;
    nodes_.push_back(std::move(node));

    if (parent != kRoot)
        nodes_[parent].children.push_back(index);
    return index;
}

std::vector<SceneTree::NodeIndex> SceneTree::add_serial(NodeIndex parent,
                                                        std::vector<ClipSpec> specs)
{
    std::string lane_id = "serial:" + std::to_string(next_serial_++);

    std::vector<NodeIndex> indices;
    indices.reserve(specs.size());
    for (auto& spec : layout_serial(std::move(specs), lane_id))
        indices.push_back(add_clip(parent, std::move(spec)));
    return indices;
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

bool SceneTree::enter(NodeIndex index)
{
    if (!contains(index))
        return false;

    const Node& node = nodes_[index];
    if (node.parent != kRoot && !nodes_[node.parent].entered)
    {
        CADENCE_LOG_WARN("timeline", "enter({}) before its parent {} entered", index,
                         node.parent);
        return false;
    }

    enter_node(index);
    return true;
}

void SceneTree::enter_node(NodeIndex index)
{
    Node& node = nodes_[index];
    if (!node.entered)
    {
        Frame parent_start = 0;
        Frame parent_end   = kMaxFrame;
        int   parent_depth = -1;
        if (node.parent != kRoot)
        {
            const Node& p = nodes_[node.parent];
            parent_start  = p.base_start;
            parent_end    = p.base_end;
            parent_depth  = p.depth;
        }

        node.depth      = parent_depth + 1;
        node.base_start = std::max(offset_frame(parent_start, node.spec.start), parent_start);
        node.base_end   = std::min(offset_frame(parent_start, node.spec.end), parent_end);

        auto resolved = resolve_clip_interval(parent_start, parent_end, node.spec.start,
                                              node.spec.end);
        node.has_span = resolved.has_value();
        node.entered  = true;

        if (resolved)
        {
            ClipInfo info;
            info.id      = index;
            info.start   = resolved->start;
            info.end     = resolved->end;
            info.label   = node.spec.label;
            info.depth   = node.depth;
            info.lane_id = node.spec.lane_id;
            if (node.parent != kRoot)
                info.parent_id = node.parent;
            registry_.register_clip(info);
        }
        else
        {
            CADENCE_LOG_DEBUG("timeline", "clip {} '{}' has no span inside its parent", index,
                              node.spec.label);
        }
    }

    // Children are copied: entering them never reallocates nodes_, but keep the
    // loop independent of the reference above.
    std::vector<NodeIndex> kids = nodes_[index].children;
    for (NodeIndex child : kids)
        enter_node(child);
}

void SceneTree::exit(NodeIndex index)
{
    if (!contains(index))
        return;
    exit_node(index);
}

void SceneTree::exit_node(NodeIndex index)
{
    std::vector<NodeIndex> kids = nodes_[index].children;
    for (NodeIndex child : kids)
        exit_node(child);

    Node& node = nodes_[index];
    if (!node.entered)
        return;
    if (node.has_span)
        registry_.unregister_clip(index);
    node.entered  = false;
    node.has_span = false;
}

void SceneTree::update(NodeIndex index, ClipSpec spec)
{
    if (!contains(index))
        return;

    bool was_entered = nodes_[index].entered;
    exit_node(index);
    spec.start         = clamp_spec_frame(spec.start);
    spec.end           = clamp_spec_frame(spec.end);
    nodes_[index].spec = std::move(spec);
    if (was_entered)
        enter(index);
}

void SceneTree::enter_all()
{
    for (NodeIndex i = 0; i < nodes_.size(); ++i)
    {
        if (nodes_[i].parent == kRoot)
            enter_node(i);
    }
}

void SceneTree::exit_all()
{
    for (NodeIndex i = 0; i < nodes_.size(); ++i)
    {
        if (nodes_[i].parent == kRoot)
            exit_node(i);
    }
}

// ─── Time context ────────────────────────────────────────────────────────────

void SceneTree::freeze(NodeIndex index, Frame snapshot)
{
    if (!contains(index))
        return;
    nodes_[index].frozen          = true;
    nodes_[index].frozen_snapshot = sanitize_frame(snapshot);
}

void SceneTree::thaw(NodeIndex index)
{
    if (contains(index))
        nodes_[index].frozen = false;
}

TimeContext SceneTree::time_context(NodeIndex index) const
{
    if (!contains(index))
        return TimeContext{};

    std::vector<NodeIndex> chain;
    for (NodeIndex cursor = index; cursor != kRoot; cursor = nodes_[cursor].parent)
        chain.push_back(cursor);

    TimeContext ctx;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        const Node& node = nodes_[*it];
        if (node.frozen)
            ctx = ctx.freeze(node.frozen_snapshot);
        ctx = ctx.nested(node.base_start);
    }
    return ctx;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool SceneTree::contains(NodeIndex index) const
{
    return index < nodes_.size();
}

bool SceneTree::entered(NodeIndex index) const
{
    return contains(index) && nodes_[index].entered;
}

bool SceneTree::has_span(NodeIndex index) const
{
    return contains(index) && nodes_[index].entered && nodes_[index].has_span;
}

std::optional<ClipInterval> SceneTree::interval(NodeIndex index) const
{
    if (!has_span(index))
        return std::nullopt;
    return ClipInterval{nodes_[index].base_start, nodes_[index].base_end};
}

int SceneTree::depth(NodeIndex index) const
{
    return contains(index) ? nodes_[index].depth : -1;
}

std::optional<SceneTree::NodeIndex> SceneTree::parent(NodeIndex index) const
{
    if (!contains(index) || nodes_[index].parent == kRoot)
        return std::nullopt;
    return nodes_[index].parent;
}

std::vector<SceneTree::NodeIndex> SceneTree::children(NodeIndex index) const
{
    if (!contains(index))
        return {};
    return nodes_[index].children;
}

const ClipSpec* SceneTree::spec(NodeIndex index) const
{
    return contains(index) ? &nodes_[index].spec : nullptr;
}

bool SceneTree::is_active(NodeIndex         index,
                          Frame             global_frame,
                          const VisibilityState& visibility) const
{
    auto iv = interval(index);
    if (!iv || !iv->contains(global_frame))
        return false;
    return visibility.is_visible(index, registry_);
}

}   // namespace cadence
