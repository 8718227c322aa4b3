#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <termpane/fwd.hpp>
#include <vector>

#include "drop_zone.hpp"

namespace termpane
{

// ─── DragPayload ─────────────────────────────────────────────────────────────
// What a pane drag carries: the pane's session id under the custom type, and
// the same text as plain text for generic drop targets.

struct DragPayload
{
    struct Item
    {
        std::string type;
        std::string data;
    };

    static constexpr std::string_view PANE_TYPE       = "application/x-termpane-pane";
    static constexpr std::string_view PLAIN_TEXT_TYPE = "text/plain";

    std::vector<Item> items;

    static DragPayload encode(const SessionId& id);

    void                              set(std::string_view type, std::string data);
    const std::string*                find(std::string_view type) const;
    bool                              empty() const { return items.empty(); }

    // Session id from the pane item, or from the plain-text item when there
    // is no pane item. Only canonical UUIDs decode.
    std::optional<SessionId> decode() const;
};

// ─── DragGesture ─────────────────────────────────────────────────────────────
// Transient state of one pane drag, created by begin and handed to every
// update/drop/cancel call. clear() runs on every exit path.

struct DragGesture
{
    enum class State
    {
        Idle,
        Dragging
    };

    State           state = State::Idle;
    DragPayload     payload;
    DropTarget      target;             // Last hover result
    SplitContainer* hovered = nullptr;  // Container currently under the pointer

    bool is_active() const { return state == State::Dragging; }

    void clear()
    {
        state   = State::Idle;
        payload = DragPayload{};
        target  = DropTarget{};
        hovered = nullptr;
    }
};

}   // namespace termpane
