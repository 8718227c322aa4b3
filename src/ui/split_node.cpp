#include "split_node.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <termpane/logger.hpp>
#include <termpane/session.hpp>

#include "../core/session_id.hpp"

namespace termpane
{

const char* to_string(SplitAxis axis)
{
    return axis == SplitAxis::Horizontal ? "horizontal" : "vertical";
}

// ─── SplitNode ───────────────────────────────────────────────────────────────

static std::atomic<SplitNode::NodeId> s_next_node_id{1};

SplitNode::NodeId SplitNode::next_id()
{
    return s_next_node_id.fetch_add(1, std::memory_order_relaxed);
}

SplitNode::SplitNode(TerminalSession& session, const Rect& frame)
    : id_(next_id()), content_(Leaf{&session}), frame_(frame)
{
    attach_leaf_surface();
}

SplitNode::SplitNode(Content content, SplitNode* parent, const Rect& frame)
    : id_(next_id()), content_(Leaf{}), parent_(parent), frame_(frame)
{
    adopt_content(std::move(content));
}

void SplitNode::adopt_content(Content content)
{
    content_ = std::move(content);
    if (auto* split = std::get_if<Split>(&content_))
    {
        assert(split->first && split->second);
        split->first->parent_  = this;
        split->second->parent_ = this;
    }
    else
    {
        attach_leaf_surface();
    }
}

void SplitNode::attach_leaf_surface()
{
    auto* leaf = std::get_if<Leaf>(&content_);
    if (leaf && leaf->session)
    {
        leaf->session->surface().attach(id_, frame_);
    }
}

SplitNode* SplitNode::split(TerminalSession& new_session, SplitAxis axis, bool new_first)
{
    const Rect old_frame = frame_;

    // The prior surface leaves this node before it is re-homed under the
    // old-content child, keeping the same frame.
    if (auto* leaf = std::get_if<Leaf>(&content_); leaf && leaf->session)
    {
        leaf->session->surface().detach();
    }

    std::unique_ptr<SplitNode> old_child(new SplitNode(std::move(content_), this, old_frame));

    // The new leaf starts as a zero-extent strip on the edge it grows from.
    Rect anchor = old_frame;
    if (axis == SplitAxis::Horizontal)
    {
        anchor.w = 0.0f;
        if (!new_first)
            anchor.x = old_frame.right();
    }
    else
    {
        anchor.h = 0.0f;
        if (new_first)
            anchor.y = old_frame.top();
    }

    std::unique_ptr<SplitNode> new_leaf(new SplitNode(new_session, anchor));
    new_leaf->parent_  = this;
    SplitNode* created = new_leaf.get();

    Split split;
    split.axis   = axis;
    split.ratio  = DEFAULT_RATIO;
    split.first  = new_first ? std::move(new_leaf) : std::move(old_child);
    split.second = new_first ? std::move(old_child) : std::move(new_leaf);
    content_     = std::move(split);

    TERMPANE_LOG_DEBUG("split",
                       "node {} split {} (new {}): {}",
                       id_,
                       to_string(axis),
                       new_first ? "first" : "second",
                       describe());
    return created;
}

bool SplitNode::remove(const SessionId& id)
{
    auto* split = std::get_if<Split>(&content_);
    if (!split)
    {
        return false;
    }

    auto matches = [&id](const SplitNode& child)
    {
        const auto* leaf = std::get_if<Leaf>(&child.content_);
        return leaf && leaf->session && leaf->session->id() == id;
    };

    if (matches(*split->first) || matches(*split->second))
    {
        const bool                 first_removed = matches(*split->first);
        std::unique_ptr<SplitNode> removed  = std::move(first_removed ? split->first : split->second);
        std::unique_ptr<SplitNode> survivor = std::move(first_removed ? split->second : split->first);

        removed->detach_surfaces();
        promote(std::move(survivor));

        TERMPANE_LOG_DEBUG("split",
                           "removed {} from node {}: {}",
                           short_session_id(id),
                           id_,
                           describe());
        return true;
    }

    return split->first->remove(id) || split->second->remove(id);
}

void SplitNode::promote(std::unique_ptr<SplitNode> survivor)
{
    assert(survivor);

    // Only the survivor's content moves; `this` keeps its identity, parent
    // and frame. The survivor shell is destroyed on return.
    if (auto* leaf = std::get_if<Leaf>(&survivor->content_); leaf && leaf->session)
    {
        leaf->session->surface().detach();
    }
    adopt_content(std::move(survivor->content_));
    survivor->content_ = Leaf{};
}

SplitNode* SplitNode::find_node(const SessionId& id)
{
    return const_cast<SplitNode*>(static_cast<const SplitNode*>(this)->find_node(id));
}

const SplitNode* SplitNode::find_node(const SessionId& id) const
{
    if (const auto* leaf = std::get_if<Leaf>(&content_))
    {
        return leaf->session && leaf->session->id() == id ? this : nullptr;
    }

    const auto& split = std::get<Split>(content_);
    if (const SplitNode* found = split.first->find_node(id))
    {
        return found;
    }
    return split.second->find_node(id);
}

std::vector<TerminalSession*> SplitNode::all_sessions() const
{
    std::vector<TerminalSession*> out;
    std::vector<const SplitNode*> stack{this};
    while (!stack.empty())
    {
        const SplitNode* node = stack.back();
        stack.pop_back();

        if (const auto* leaf = std::get_if<Leaf>(&node->content_))
        {
            if (leaf->session)
                out.push_back(leaf->session);
            continue;
        }

        const auto& split = std::get<Split>(node->content_);
        stack.push_back(split.second.get());
        stack.push_back(split.first.get());
    }
    return out;
}

void SplitNode::collect_leaves(std::vector<SplitNode*>& out)
{
    if (auto* split = std::get_if<Split>(&content_))
    {
        split->first->collect_leaves(out);
        split->second->collect_leaves(out);
        return;
    }
    out.push_back(this);
}

TerminalSession* SplitNode::session() const
{
    const auto* leaf = std::get_if<Leaf>(&content_);
    return leaf ? leaf->session : nullptr;
}

SplitNode* SplitNode::first() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? split->first.get() : nullptr;
}

SplitNode* SplitNode::second() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? split->second.get() : nullptr;
}

SplitAxis SplitNode::axis() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? split->axis : SplitAxis::Horizontal;
}

float SplitNode::ratio() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? split->ratio : DEFAULT_RATIO;
}

void SplitNode::set_ratio(float ratio)
{
    if (auto* split = std::get_if<Split>(&content_))
    {
        split->ratio = std::clamp(ratio, MIN_RATIO, MAX_RATIO);
    }
}

size_t SplitNode::count_nodes() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? 1 + split->first->count_nodes() + split->second->count_nodes() : 1;
}

size_t SplitNode::count_leaves() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? split->first->count_leaves() + split->second->count_leaves() : 1;
}

size_t SplitNode::count_splits() const
{
    const auto* split = std::get_if<Split>(&content_);
    return split ? 1 + split->first->count_splits() + split->second->count_splits() : 0;
}

bool SplitNode::check_invariants() const
{
    std::vector<const TerminalSession*> seen;
    return check_subtree(seen);
}

bool SplitNode::check_subtree(std::vector<const TerminalSession*>& seen) const
{
    if (const auto* leaf = std::get_if<Leaf>(&content_))
    {
        if (!leaf->session)
            return false;
        for (const TerminalSession* s : seen)
        {
            if (s == leaf->session || s->id() == leaf->session->id())
                return false;
        }
        seen.push_back(leaf->session);
        return true;
    }

    const auto& split = std::get<Split>(content_);
    if (!split.first || !split.second)
        return false;
    if (split.first->parent_ != this || split.second->parent_ != this)
        return false;
    return split.first->check_subtree(seen) && split.second->check_subtree(seen);
}

std::string SplitNode::describe(const Labeler& labeler) const
{
    if (const auto* leaf = std::get_if<Leaf>(&content_))
    {
        if (!leaf->session)
            return "?";
        return labeler ? labeler(*leaf->session) : short_session_id(leaf->session->id());
    }

    const auto& split = std::get<Split>(content_);
    std::string out(split.axis == SplitAxis::Horizontal ? "H(" : "V(");
    out += split.first->describe(labeler);
    out += ',';
    out += split.second->describe(labeler);
    out += ')';
    return out;
}

// ─── Layout ──────────────────────────────────────────────────────────────────

void SplitNode::compute_layout(const Rect& bounds, float divider_thickness)
{
    frame_             = bounds;
    divider_thickness_ = std::max(divider_thickness, 0.0f);

    if (auto* leaf = std::get_if<Leaf>(&content_))
    {
        if (leaf->session && leaf->session->surface().host_id() == id_)
        {
            leaf->session->surface().set_frame(frame_);
        }
        return;
    }

    auto& split = std::get<Split>(content_);
    const float half = divider_thickness_ * 0.5f;

    if (split.axis == SplitAxis::Horizontal)
    {
        // Left | Right
        float split_x  = frame_.x + frame_.w * split.ratio;
        float first_w  = std::max(split_x - frame_.x - half, 0.0f);
        float second_x = split_x + half;
        float second_w = std::max(frame_.right() - second_x, 0.0f);

        split.first->compute_layout(Rect{frame_.x, frame_.y, first_w, frame_.h}, divider_thickness_);
        split.second->compute_layout(Rect{second_x, frame_.y, second_w, frame_.h},
                                     divider_thickness_);
    }
    else
    {
        // Top over bottom; y grows upward so the first child sits above.
        float split_y  = frame_.top() - frame_.h * split.ratio;
        float first_y  = split_y + half;
        float first_h  = std::max(frame_.top() - first_y, 0.0f);
        float second_h = std::max(split_y - half - frame_.y, 0.0f);

        split.first->compute_layout(Rect{frame_.x, first_y, frame_.w, first_h}, divider_thickness_);
        split.second->compute_layout(Rect{frame_.x, frame_.y, frame_.w, second_h},
                                     divider_thickness_);
    }
}

Rect SplitNode::divider_rect() const
{
    const auto* split = std::get_if<Split>(&content_);
    if (!split)
    {
        return Rect{};
    }

    const float half = divider_thickness_ * 0.5f;
    if (split->axis == SplitAxis::Horizontal)
    {
        float split_x = frame_.x + frame_.w * split->ratio;
        return Rect{split_x - half, frame_.y, divider_thickness_, frame_.h};
    }
    float split_y = frame_.top() - frame_.h * split->ratio;
    return Rect{frame_.x, split_y - half, frame_.w, divider_thickness_};
}

void SplitNode::set_visible(bool visible)
{
    if (auto* split = std::get_if<Split>(&content_))
    {
        split->first->set_visible(visible);
        split->second->set_visible(visible);
        return;
    }
    if (TerminalSession* s = session())
    {
        s->surface().set_visible(visible);
    }
}

void SplitNode::detach_surfaces()
{
    if (auto* split = std::get_if<Split>(&content_))
    {
        split->first->detach_surfaces();
        split->second->detach_surfaces();
        return;
    }
    TerminalSession* s = session();
    if (s && s->surface().host_id() == id_)
    {
        s->surface().detach();
    }
}

}   // namespace termpane
