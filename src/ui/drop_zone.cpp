#include "drop_zone.hpp"

#include <algorithm>

namespace termpane
{

const char* to_string(DropZone zone)
{
    switch (zone)
    {
        case DropZone::None:
            return "none";
        case DropZone::Left:
            return "left";
        case DropZone::Right:
            return "right";
        case DropZone::Top:
            return "top";
        case DropZone::Bottom:
            return "bottom";
        case DropZone::Center:
            return "center";
    }
    return "unknown";
}

DropZone classify_drop_zone(const Rect& pane, Point point)
{
    if (pane.empty())
    {
        return DropZone::Center;
    }

    float rel_x = (point.x - pane.x) / pane.w;
    float rel_y = (point.y - pane.y) / pane.h;

    if (rel_x < DROP_ZONE_FRACTION)
        return DropZone::Left;
    if (rel_x > 1.0f - DROP_ZONE_FRACTION)
        return DropZone::Right;
    if (rel_y < DROP_ZONE_FRACTION)
        return DropZone::Bottom;
    if (rel_y > 1.0f - DROP_ZONE_FRACTION)
        return DropZone::Top;
    return DropZone::Center;
}

ZonePlacement zone_placement(DropZone zone)
{
    switch (zone)
    {
        case DropZone::Left:
            return {SplitAxis::Horizontal, true};
        case DropZone::Right:
            return {SplitAxis::Horizontal, false};
        case DropZone::Top:
            return {SplitAxis::Vertical, true};
        case DropZone::Bottom:
            return {SplitAxis::Vertical, false};
        case DropZone::Center:
        case DropZone::None:
            break;
    }
    return {SplitAxis::Horizontal, false};
}

Rect drop_highlight(const Rect& pane, DropZone zone)
{
    const float e = DROP_HIGHLIGHT_EDGE_INSET;
    const float half_w = pane.w * 0.5f;
    const float half_h = pane.h * 0.5f;

    auto sized = [](float x, float y, float w, float h)
    { return Rect{x, y, std::max(w, 0.0f), std::max(h, 0.0f)}; };

    switch (zone)
    {
        case DropZone::Left:
            return sized(pane.x + e, pane.y + e, half_w - 2 * e, pane.h - 2 * e);
        case DropZone::Right:
            return sized(pane.x + half_w + e, pane.y + e, half_w - 2 * e, pane.h - 2 * e);
        case DropZone::Top:
            return sized(pane.x + e, pane.y + half_h + e, pane.w - 2 * e, half_h - 2 * e);
        case DropZone::Bottom:
            return sized(pane.x + e, pane.y + e, pane.w - 2 * e, half_h - 2 * e);
        case DropZone::Center:
            return pane.inset(DROP_HIGHLIGHT_CENTER_INSET);
        case DropZone::None:
            break;
    }
    return Rect{};
}

}   // namespace termpane
