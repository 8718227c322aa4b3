#pragma once

#include <termpane/fwd.hpp>

namespace termpane
{

// Panel coordinates: origin at the bottom-left of the content area, y up.

struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float top() const { return y + h; }

    bool empty() const { return w <= 0.0f || h <= 0.0f; }

    // Edges are inclusive so a point on a shared border belongs to both
    // neighbours; callers test the first child before the second.
    bool contains(Point p) const
    {
        return p.x >= x && p.x <= x + w && p.y >= y && p.y <= y + h;
    }

    Rect inset(float d) const
    {
        float nw = w - 2.0f * d;
        float nh = h - 2.0f * d;
        return Rect{x + d, y + d, nw > 0.0f ? nw : 0.0f, nh > 0.0f ? nh : 0.0f};
    }

    bool operator==(const Rect& o) const = default;
};

}   // namespace termpane
