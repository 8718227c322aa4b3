#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <termpane/fwd.hpp>
#include <termpane/geometry.hpp>
#include <variant>
#include <vector>

namespace termpane
{

// ─── Split axis ──────────────────────────────────────────────────────────────

enum class SplitAxis
{
    Horizontal,   // first | second  (vertical divider)
    Vertical      // first over second (horizontal divider)
};

const char* to_string(SplitAxis axis);

class SplitNode;

// ─── Node content ────────────────────────────────────────────────────────────

struct PaneLeaf
{
    TerminalSession* session = nullptr;
};

struct PaneSplit
{
    SplitAxis                  axis  = SplitAxis::Horizontal;
    float                      ratio = 0.5f;
    std::unique_ptr<SplitNode> first;
    std::unique_ptr<SplitNode> second;
};

// ─── SplitNode ───────────────────────────────────────────────────────────────
// One node of a pane tree: either a leaf hosting a single session's surface,
// or a split of exactly two children along an axis.
//
// Children are owned through unique_ptr; parent() is a plain back-reference
// used for upward traversal only. Sessions are never owned: a leaf only
// attaches, moves and detaches the session's surface.

class SplitNode
{
   public:
    using NodeId = uint64_t;
    using Labeler = std::function<std::string(const TerminalSession&)>;

    using Leaf    = PaneLeaf;
    using Split   = PaneSplit;
    using Content = std::variant<Leaf, Split>;

    // Create a leaf hosting the session and attach its surface.
    explicit SplitNode(TerminalSession& session, const Rect& frame = {});
    ~SplitNode() = default;

    SplitNode(const SplitNode&)            = delete;
    SplitNode& operator=(const SplitNode&) = delete;

    // ── Structure ───────────────────────────────────────────────────────

    // Turn this node into a split: one child is a new leaf hosting
    // new_session, the other takes over this node's previous content
    // (re-homed, not copied). new_first puts the new leaf first along the
    // axis (left or top). Returns the new leaf.
    SplitNode* split(TerminalSession& new_session, SplitAxis axis, bool new_first);

    // Remove the leaf holding id from this subtree. When it is a direct
    // child, this node takes over the sibling's content and the split level
    // disappears. A leaf never removes itself; the container handles that.
    bool remove(const SessionId& id);

    SplitNode*       find_node(const SessionId& id);
    const SplitNode* find_node(const SessionId& id) const;

    // Leaf sessions, first subtree before second.
    std::vector<TerminalSession*> all_sessions() const;
    void                          collect_leaves(std::vector<SplitNode*>& out);

    // ── Queries ─────────────────────────────────────────────────────────

    bool is_leaf() const { return std::holds_alternative<Leaf>(content_); }
    bool is_split() const { return std::holds_alternative<Split>(content_); }

    NodeId           id() const { return id_; }
    TerminalSession* session() const;
    SplitNode*       first() const;
    SplitNode*       second() const;
    SplitNode*       parent() const { return parent_; }

    SplitAxis axis() const;
    float     ratio() const;
    void      set_ratio(float ratio);

    int  pane_number() const { return pane_number_; }
    void set_pane_number(int n) { pane_number_ = n; }

    size_t count_nodes() const;
    size_t count_leaves() const;
    size_t count_splits() const;

    // Parent links, child presence and session uniqueness across the subtree.
    bool check_invariants() const;

    // Compact structure, e.g. "H(a,V(b,c))". Leaves use labeler, or the
    // first eight characters of the session id when none is given.
    std::string describe(const Labeler& labeler = {}) const;

    // ── Geometry ────────────────────────────────────────────────────────

    void compute_layout(const Rect& bounds, float divider_thickness = DEFAULT_DIVIDER_THICKNESS);
    Rect frame() const { return frame_; }

    // Divider between the two children (zero rect for leaves).
    Rect divider_rect() const;

    void set_visible(bool visible);

    // Detach every leaf surface still hosted by this subtree.
    void detach_surfaces();

    // ── Constants ───────────────────────────────────────────────────────

    static constexpr float DEFAULT_RATIO             = 0.5f;
    static constexpr float MIN_RATIO                 = 0.1f;
    static constexpr float MAX_RATIO                 = 0.9f;
    static constexpr float DEFAULT_DIVIDER_THICKNESS = 1.0f;

   private:
    SplitNode(Content content, SplitNode* parent, const Rect& frame);

    void adopt_content(Content content);
    void promote(std::unique_ptr<SplitNode> survivor);
    void attach_leaf_surface();
    bool check_subtree(std::vector<const TerminalSession*>& seen) const;

    static NodeId next_id();

    NodeId     id_;
    Content    content_;
    SplitNode* parent_            = nullptr;
    Rect       frame_{};
    float      divider_thickness_ = DEFAULT_DIVIDER_THICKNESS;
    int        pane_number_       = 0;
};

}   // namespace termpane
