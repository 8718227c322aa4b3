#include "split_container.hpp"

#include <algorithm>
#include <cassert>
#include <termpane/logger.hpp>
#include <termpane/session.hpp>

#include "../core/session_id.hpp"

namespace termpane
{

namespace
{

DropTarget hit_test_node(const SplitNode& node, Point point)
{
    if (node.is_leaf())
    {
        DropTarget result;
        result.zone           = classify_drop_zone(node.frame(), point);
        result.target         = node.session()->id();
        result.highlight_rect = drop_highlight(node.frame(), result.zone);
        return result;
    }

    if (node.first()->frame().contains(point))
        return hit_test_node(*node.first(), point);
    if (node.second()->frame().contains(point))
        return hit_test_node(*node.second(), point);

    DropTarget fallback;
    fallback.zone = DropZone::Center;
    return fallback;
}

SplitNode* divider_at_node(SplitNode* node, Point point, float slop)
{
    if (!node || node->is_leaf())
        return nullptr;

    if (SplitNode* hit = divider_at_node(node->first(), point, slop))
        return hit;
    if (SplitNode* hit = divider_at_node(node->second(), point, slop))
        return hit;

    Rect d = node->divider_rect();
    Rect grab{d.x - slop, d.y - slop, d.w + 2.0f * slop, d.h + 2.0f * slop};
    return grab.contains(point) ? node : nullptr;
}

SplitNode* find_split_node(SplitNode* node, SplitNode::NodeId id)
{
    if (!node || node->is_leaf())
        return nullptr;
    if (node->id() == id)
        return node;
    if (SplitNode* found = find_split_node(node->first(), id))
        return found;
    return find_split_node(node->second(), id);
}

}   // anonymous namespace

SplitContainer::SplitContainer(SessionId tab_id) : id_(std::move(tab_id)) {}

SplitContainer::SplitContainer(SessionId tab_id, TerminalSession& root) : id_(std::move(tab_id))
{
    set_root(root);
}

// ─── Structure ───────────────────────────────────────────────────────────────

void SplitContainer::set_root(TerminalSession& session)
{
    if (root_)
    {
        root_->detach_surfaces();
    }
    root_ = std::make_unique<SplitNode>(session, bounds_);
    root_->set_visible(visible_);
    structure_changed();
}

SplitNode* SplitContainer::add_session(TerminalSession&                session,
                                       const std::optional<SessionId>& relative_to,
                                       DropZone                        zone)
{
    if (!root_)
    {
        set_root(session);
        return root_.get();
    }

    SplitNode* target = nullptr;
    if (relative_to)
    {
        target = root_->find_node(*relative_to);
        if (!target)
        {
            TERMPANE_LOG_DEBUG("container",
                               "tab {}: pane {} not found, splitting root",
                               short_session_id(id_),
                               short_session_id(*relative_to));
        }
    }
    if (!target)
    {
        target = root_.get();
    }

    ZonePlacement placement = zone_placement(zone);
    SplitNode*    created   = target->split(session, placement.axis, placement.new_first);
    created->set_visible(visible_);

    TERMPANE_LOG_DEBUG("container",
                       "tab {}: added {} at {}",
                       short_session_id(id_),
                       short_session_id(session.id()),
                       to_string(zone));
    structure_changed();
    return created;
}

bool SplitContainer::remove_session(const SessionId& id)
{
    if (!root_)
    {
        return false;
    }

    if (root_->is_leaf())
    {
        if (root_->session()->id() != id)
            return false;

        root_->detach_surfaces();
        root_.reset();
        TERMPANE_LOG_DEBUG("container", "tab {}: last pane removed", short_session_id(id_));
        return true;
    }

    if (!root_->remove(id))
    {
        return false;
    }
    structure_changed();
    return true;
}

void SplitContainer::structure_changed()
{
    assert(!root_ || root_->check_invariants());
    renumber();
    layout();
}

void SplitContainer::renumber()
{
    if (!root_)
        return;

    std::vector<SplitNode*> leaves;
    root_->collect_leaves(leaves);
    int n = 1;
    for (SplitNode* leaf : leaves)
    {
        leaf->set_pane_number(n++);
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<TerminalSession*> SplitContainer::all_sessions() const
{
    return root_ ? root_->all_sessions() : std::vector<TerminalSession*>{};
}

bool SplitContainer::contains(const SessionId& id) const
{
    return root_ && root_->find_node(id) != nullptr;
}

TerminalSession* SplitContainer::find_session(const SessionId& id) const
{
    if (!root_)
        return nullptr;
    const SplitNode* node = root_->find_node(id);
    return node ? node->session() : nullptr;
}

TerminalSession* SplitContainer::first_session() const
{
    if (!root_)
        return nullptr;
    auto sessions = root_->all_sessions();
    return sessions.empty() ? nullptr : sessions.front();
}

size_t SplitContainer::pane_count() const
{
    return root_ ? root_->count_leaves() : 0;
}

int SplitContainer::pane_number(const SessionId& id) const
{
    if (!root_)
        return 0;
    const SplitNode* node = root_->find_node(id);
    return node ? node->pane_number() : 0;
}

// ─── Layout / visibility ─────────────────────────────────────────────────────

void SplitContainer::set_bounds(const Rect& bounds)
{
    bounds_ = bounds;
    layout();
}

void SplitContainer::set_divider_thickness(float thickness)
{
    divider_thickness_ = std::max(thickness, 0.0f);
    layout();
}

void SplitContainer::set_visible(bool visible)
{
    visible_ = visible;
    if (root_)
    {
        root_->set_visible(visible);
    }
}

void SplitContainer::layout()
{
    if (root_ && !bounds_.empty())
    {
        root_->compute_layout(bounds_, divider_thickness_);
    }
}

// ─── Drop zones ──────────────────────────────────────────────────────────────

DropTarget SplitContainer::hit_test_drop_zone(Point point) const
{
    if (!root_)
    {
        return DropTarget{};
    }
    return hit_test_node(*root_, point);
}

void SplitContainer::drag_updated(DragGesture& gesture, Point point)
{
    if (!gesture.is_active())
    {
        return;
    }
    gesture.hovered = this;
    gesture.target  = hit_test_drop_zone(point);
    TERMPANE_LOG_TRACE("drag", "tab {}: hover {}", short_session_id(id_), to_string(gesture.target.zone));
}

void SplitContainer::drag_exited(DragGesture& gesture)
{
    if (gesture.hovered != this)
    {
        return;
    }
    gesture.hovered = nullptr;
    gesture.target  = DropTarget{};
}

bool SplitContainer::perform_drop(DragGesture& gesture)
{
    const bool over_this = gesture.is_active() && gesture.hovered == this;
    const DropTarget target = gesture.target;
    const std::optional<SessionId> dragged = gesture.payload.decode();
    gesture.clear();

    if (!over_this || target.zone == DropZone::None)
    {
        return false;
    }
    if (!dragged)
    {
        TERMPANE_LOG_WARN("drag", "tab {}: drop carried no pane id, ignored", short_session_id(id_));
        return false;
    }

    TERMPANE_LOG_DEBUG("drag",
                       "tab {}: drop {} at {}",
                       short_session_id(id_),
                       short_session_id(*dragged),
                       to_string(target.zone));
    // The handler may restructure (or destroy) containers; keep a copy.
    DropCallback on_drop = on_drop_;
    if (on_drop)
    {
        on_drop(*dragged, target.zone, target.target);
    }
    return true;
}

// ─── Divider dragging ────────────────────────────────────────────────────────

SplitNode* SplitContainer::divider_at(Point point) const
{
    return divider_at_node(root_.get(), point, DIVIDER_HIT_SLOP);
}

SplitNode* SplitContainer::find_split(SplitNode::NodeId id) const
{
    return find_split_node(root_.get(), id);
}

bool SplitContainer::drag_divider(SplitNode* node, float position)
{
    if (!node || !node->is_split())
    {
        return false;
    }

    const Rect  f      = node->frame();
    const bool  horiz  = node->axis() == SplitAxis::Horizontal;
    const float extent = horiz ? f.w : f.h;
    if (extent <= 0.0f)
    {
        return false;
    }

    // Vertical splits put the first child on top, so measure down from it.
    float ratio = horiz ? (position - f.x) / extent : (f.top() - position) / extent;

    float lo = std::max(SplitNode::MIN_RATIO, min_pane_size_ / extent);
    float hi = std::min(SplitNode::MAX_RATIO, 1.0f - min_pane_size_ / extent);
    if (lo > hi)
    {
        lo = hi = SplitNode::DEFAULT_RATIO;
    }

    node->set_ratio(std::clamp(ratio, lo, hi));
    node->compute_layout(f, divider_thickness_);
    return true;
}

}   // namespace termpane
