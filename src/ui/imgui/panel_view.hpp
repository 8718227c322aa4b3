#pragma once

#ifdef TERMPANE_USE_IMGUI

    #include <optional>
    #include <termpane/fwd.hpp>
    #include <termpane/geometry.hpp>

    #include "../drag_payload.hpp"
    #include "../split_node.hpp"

struct ImVec2;

namespace termpane
{

class PanelCoordinator;

// ─── PanelView ───────────────────────────────────────────────────────────────
// Immediate-mode presentation of a PanelCoordinator inside the current ImGui
// window: the tab bar, one framed rect per pane, dividers and the drop
// overlay. Pointer input is translated into panel coordinates (y up) and fed
// back as tab bar requests, pane drags and divider drags.

class PanelView
{
   public:
    explicit PanelView(PanelCoordinator& coordinator);

    PanelView(const PanelView&)            = delete;
    PanelView& operator=(const PanelView&) = delete;

    // Draw into the current window. Call between ImGui::Begin/End.
    void draw();

    bool is_dragging_pane() const { return gesture_.is_active(); }

    static constexpr float TAB_BAR_HEIGHT   = 26.0f;
    static constexpr float PANE_HEADER_SIZE = 18.0f;

   private:
    void draw_tab_bar();
    void draw_panes(float x, float y, float w, float h);
    void draw_node(const SplitNode& node);
    void draw_drop_overlay();
    void handle_pointer();

    Point to_panel(const ImVec2& screen) const;
    Rect  to_screen(const Rect& panel) const;

    PanelCoordinator& coordinator_;
    DragGesture       gesture_;

    // Divider being dragged, by owning tab and node id; resolved every frame.
    struct DividerDrag
    {
        SessionId         tab;
        SplitNode::NodeId node = 0;
    };
    std::optional<DividerDrag> divider_drag_;

    // Screen-space origin (top-left) and height of the pane area.
    float origin_x_ = 0.0f;
    float origin_y_ = 0.0f;
    float height_   = 0.0f;
};

}   // namespace termpane

#endif   // TERMPANE_USE_IMGUI
