#pragma once

#include <optional>
#include <termpane/fwd.hpp>
#include <termpane/geometry.hpp>

#include "split_node.hpp"

namespace termpane
{

// ─── Drop zone ───────────────────────────────────────────────────────────────
// Where a dragged pane would land relative to the pane under the pointer.

enum class DropZone
{
    None,
    Left,
    Right,
    Top,
    Bottom,
    Center   // No true tab-into-pane merge; placed like Right
};

const char* to_string(DropZone zone);

struct DropTarget
{
    DropZone                 zone = DropZone::None;
    std::optional<SessionId> target;           // Pane under the pointer, if any
    Rect                     highlight_rect{};   // Visual indicator rect
};

// How a zone maps onto SplitNode::split().
struct ZonePlacement
{
    SplitAxis axis      = SplitAxis::Horizontal;
    bool      new_first = false;
};

// Edge band, as a fraction of the pane's width or height. One value for all
// four edges.
inline constexpr float DROP_ZONE_FRACTION = 0.25f;

inline constexpr float DROP_HIGHLIGHT_EDGE_INSET   = 4.0f;
inline constexpr float DROP_HIGHLIGHT_CENTER_INSET = 8.0f;

// Classify point within pane. Edges are tested left, right, bottom, top;
// everything else (and any point in a zero-size pane) is Center.
DropZone classify_drop_zone(const Rect& pane, Point point);

ZonePlacement zone_placement(DropZone zone);

// Overlay for zone over pane: the matching half inset by the edge inset, or
// the whole pane inset by the center inset.
Rect drop_highlight(const Rect& pane, DropZone zone);

}   // namespace termpane
