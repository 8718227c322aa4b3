#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <termpane/fwd.hpp>
#include <termpane/geometry.hpp>
#include <vector>

#include "drag_payload.hpp"
#include "drop_zone.hpp"
#include "split_node.hpp"

namespace termpane
{

// ─── SplitContainer ──────────────────────────────────────────────────────────
// The pane tree of one tab. Owns the root SplitNode (none while exhausted),
// keeps pane numbers in depth-first order, lays the tree out inside its
// bounds and turns pointer positions into drop targets during a drag.

class SplitContainer
{
   public:
    using DropCallback = std::function<
        void(const SessionId& dragged, DropZone zone, const std::optional<SessionId>& target)>;

    // Identity is the tab id: the id of the session the tab was created for.
    explicit SplitContainer(SessionId tab_id);
    SplitContainer(SessionId tab_id, TerminalSession& root);
    ~SplitContainer() = default;

    SplitContainer(const SplitContainer&)            = delete;
    SplitContainer& operator=(const SplitContainer&) = delete;

    const SessionId& id() const { return id_; }

    // ── Structure ───────────────────────────────────────────────────────

    // Discard any existing tree and install a single leaf.
    void set_root(TerminalSession& session);

    // Split the pane holding relative_to (or the root when absent or not
    // found) according to zone. An empty container takes the session as
    // its root. Returns the new leaf.
    SplitNode* add_session(TerminalSession&                session,
                           const std::optional<SessionId>& relative_to,
                           DropZone                        zone);

    // Remove a pane. Removing the only pane leaves the container empty; the
    // owner decides whether that tears the tab down.
    bool remove_session(const SessionId& id);

    // ── Queries ─────────────────────────────────────────────────────────

    std::vector<TerminalSession*> all_sessions() const;
    bool                          contains(const SessionId& id) const;
    TerminalSession*              find_session(const SessionId& id) const;
    TerminalSession*              first_session() const;
    bool                          is_empty() const { return !root_; }
    size_t                        pane_count() const;

    // 1-based depth-first pane number, 0 when not present.
    int pane_number(const SessionId& id) const;

    SplitNode*       root() { return root_.get(); }
    const SplitNode* root() const { return root_.get(); }

    // ── Layout / visibility ─────────────────────────────────────────────

    void set_bounds(const Rect& bounds);
    Rect bounds() const { return bounds_; }

    void  set_divider_thickness(float thickness);
    float divider_thickness() const { return divider_thickness_; }
    void  set_min_pane_size(float size) { min_pane_size_ = size; }
    float min_pane_size() const { return min_pane_size_; }

    void set_visible(bool visible);
    bool is_visible() const { return visible_; }

    void layout();

    // ── Drop zones ──────────────────────────────────────────────────────

    // Pane under point and the zone within it. Between children (a gap or a
    // rounding miss) the result is Center with no target. An empty
    // container reports DropZone::None.
    DropTarget hit_test_drop_zone(Point point) const;

    // ── Drag gesture hooks ──────────────────────────────────────────────

    void drag_updated(DragGesture& gesture, Point point);
    void drag_exited(DragGesture& gesture);

    // Decode the payload and report it through the drop callback. Returns
    // false (and changes nothing) when there is no zone or no decodable id.
    // The gesture is cleared on every path.
    bool perform_drop(DragGesture& gesture);

    void set_on_drop(DropCallback cb) { on_drop_ = std::move(cb); }

    // ── Divider dragging ────────────────────────────────────────────────

    // Split node whose divider (widened by DIVIDER_HIT_SLOP) contains point.
    SplitNode* divider_at(Point point) const;

    // Split node with id still in this tree, or nullptr once it was removed
    // or collapsed into a leaf. Callers holding a divider across frames
    // look it up again through this.
    SplitNode* find_split(SplitNode::NodeId id) const;

    // Move a divider to position (x for horizontal splits, y for vertical),
    // keeping both sides at least min_pane_size wide.
    bool drag_divider(SplitNode* node, float position);

    // ── Constants ───────────────────────────────────────────────────────

    static constexpr float DEFAULT_MIN_PANE_SIZE = 40.0f;
    static constexpr float DIVIDER_HIT_SLOP      = 3.0f;

   private:
    void structure_changed();
    void renumber();

    SessionId                  id_;
    std::unique_ptr<SplitNode> root_;
    Rect                       bounds_{};
    float                      divider_thickness_ = SplitNode::DEFAULT_DIVIDER_THICKNESS;
    float                      min_pane_size_     = DEFAULT_MIN_PANE_SIZE;
    bool                       visible_           = true;

    DropCallback on_drop_;
};

}   // namespace termpane
