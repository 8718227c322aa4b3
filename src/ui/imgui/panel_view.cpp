#ifdef TERMPANE_USE_IMGUI

    #include "panel_view.hpp"

    #include <imgui.h>
    #include <string>
    #include <termpane/logger.hpp>
    #include <termpane/session.hpp>

    #include "../panel_coordinator.hpp"
    #include "../split_node.hpp"

namespace termpane
{

namespace
{

constexpr ImU32 PANE_BORDER_COL   = IM_COL32(70, 74, 82, 255);
constexpr ImU32 PANE_FOCUS_COL    = IM_COL32(95, 150, 230, 255);
constexpr ImU32 PANE_HEADER_COL   = IM_COL32(38, 40, 46, 255);
constexpr ImU32 DIVIDER_COL       = IM_COL32(55, 58, 66, 255);
constexpr ImU32 DROP_FILL_COL     = IM_COL32(95, 150, 230, 60);
constexpr ImU32 DROP_BORDER_COL   = IM_COL32(95, 150, 230, 200);
constexpr ImU32 HEADER_TEXT_COL   = IM_COL32(200, 204, 212, 255);

}   // anonymous namespace

PanelView::PanelView(PanelCoordinator& coordinator) : coordinator_(coordinator) {}

// ─── Coordinate mapping ──────────────────────────────────────────────────────

Point PanelView::to_panel(const ImVec2& screen) const
{
    return Point{screen.x - origin_x_, origin_y_ + height_ - screen.y};
}

Rect PanelView::to_screen(const Rect& panel) const
{
    return Rect{origin_x_ + panel.x, origin_y_ + height_ - panel.top(), panel.w, panel.h};
}

// ─── Drawing ─────────────────────────────────────────────────────────────────

void PanelView::draw()
{
    draw_tab_bar();

    if (coordinator_.is_collapsed())
    {
        return;
    }

    ImVec2 pos   = ImGui::GetCursorScreenPos();
    ImVec2 avail = ImGui::GetContentRegionAvail();
    draw_panes(pos.x, pos.y, avail.x, avail.y);
    handle_pointer();
    draw_drop_overlay();
}

void PanelView::draw_tab_bar()
{
    TabBarModel& model = coordinator_.tab_bar();

    ImGui::BeginChild("##termpane_tabs", ImVec2(0.0f, TAB_BAR_HEIGHT), false,
                      ImGuiWindowFlags_NoScrollbar);

    if (ImGui::BeginTabBar("##termpane_tab_bar", ImGuiTabBarFlags_AutoSelectNewTabs))
    {
        // Copy: requests below may add or remove tabs.
        auto tabs = model.tabs();
        auto selected = model.selected_id();
        for (const auto& tab : tabs)
        {
            std::string label = tab.title + "###" + tab.id;
            bool        open  = true;

            ImGuiTabItemFlags flags = 0;
            if (selected && *selected == tab.id)
                flags |= ImGuiTabItemFlags_SetSelected;

            if (ImGui::BeginTabItem(label.c_str(), &open, flags))
            {
                if (!selected || *selected != tab.id)
                    model.request_select_tab(tab.id);
                ImGui::EndTabItem();
            }
            if (!open)
            {
                model.request_close_tab(tab.id);
            }
        }

        if (ImGui::TabItemButton("+", ImGuiTabItemFlags_Trailing))
        {
            model.request_new_tab();
        }
        if (ImGui::TabItemButton(coordinator_.is_collapsed() ? "^" : "v",
                                 ImGuiTabItemFlags_Trailing))
        {
            model.request_collapse_panel();
        }
        ImGui::EndTabBar();
    }
    ImGui::EndChild();
}

void PanelView::draw_panes(float x, float y, float w, float h)
{
    origin_x_ = x;
    origin_y_ = y;
    height_   = h;

    Rect bounds{0.0f, 0.0f, w, h};
    if (!(coordinator_.content_bounds() == bounds))
    {
        coordinator_.set_content_bounds(bounds);
    }

    auto selected = coordinator_.selected_tab();
    if (!selected)
        return;
    SplitContainer* container = coordinator_.container_for_tab(*selected);
    if (!container || !container->root())
        return;

    draw_node(*container->root());
}

void PanelView::draw_node(const SplitNode& node)
{
    ImDrawList* dl = ImGui::GetWindowDrawList();

    if (node.is_split())
    {
        Rect d = to_screen(node.divider_rect());
        dl->AddRectFilled(ImVec2(d.x, d.y), ImVec2(d.x + d.w, d.y + d.h), DIVIDER_COL);
        draw_node(*node.first());
        draw_node(*node.second());
        return;
    }

    const TerminalSession* session = node.session();
    Rect                   r       = to_screen(node.frame());
    bool focused = session && coordinator_.focused_session() == session;

    dl->AddRectFilled(ImVec2(r.x, r.y), ImVec2(r.x + r.w, r.y + PANE_HEADER_SIZE), PANE_HEADER_COL);
    dl->AddRect(ImVec2(r.x, r.y),
                ImVec2(r.x + r.w, r.y + r.h),
                focused ? PANE_FOCUS_COL : PANE_BORDER_COL);

    if (session)
    {
        std::string header = std::to_string(node.pane_number()) + "  " + session->title();
        dl->AddText(ImVec2(r.x + 6.0f, r.y + 2.0f), HEADER_TEXT_COL, header.c_str());
    }
}

void PanelView::draw_drop_overlay()
{
    if (!gesture_.is_active() || gesture_.target.zone == DropZone::None)
        return;

    Rect h = to_screen(gesture_.target.highlight_rect);
    if (h.empty())
        return;

    ImDrawList* dl = ImGui::GetForegroundDrawList();
    dl->AddRectFilled(ImVec2(h.x, h.y), ImVec2(h.x + h.w, h.y + h.h), DROP_FILL_COL, 4.0f);
    dl->AddRect(ImVec2(h.x, h.y), ImVec2(h.x + h.w, h.y + h.h), DROP_BORDER_COL, 4.0f, 0, 2.0f);
}

// ─── Input ───────────────────────────────────────────────────────────────────

void PanelView::handle_pointer()
{
    const ImGuiIO& io = ImGui::GetIO();
    Point          p  = to_panel(io.MousePos);

    auto selected = coordinator_.selected_tab();
    SplitContainer* container = selected ? coordinator_.container_for_tab(*selected) : nullptr;
    if (!container)
        return;

    const Rect bounds   = coordinator_.content_bounds();
    const bool hovering = ImGui::IsWindowHovered() && bounds.contains(p);

    // Divider drags take priority over pane drags.
    // A tab switch or a close that removed the split ends the drag.
    if (divider_drag_)
    {
        SplitNode* divider = divider_drag_->tab == container->id()
                                 ? container->find_split(divider_drag_->node)
                                 : nullptr;
        if (divider && ImGui::IsMouseDown(ImGuiMouseButton_Left))
        {
            float pos = divider->axis() == SplitAxis::Horizontal ? p.x : p.y;
            container->drag_divider(divider, pos);
            return;
        }
        divider_drag_.reset();
        return;
    }

    if (gesture_.is_active())
    {
        if (ImGui::IsKeyPressed(ImGuiKey_Escape))
        {
            coordinator_.cancel_drag(gesture_);
            return;
        }
        if (hovering)
            coordinator_.update_drag(gesture_, p);
        else
            coordinator_.exit_drag(gesture_);

        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
        {
            coordinator_.end_drag(gesture_);
        }
        return;
    }

    if (!hovering || !ImGui::IsMouseClicked(ImGuiMouseButton_Left))
        return;

    if (SplitNode* divider = container->divider_at(p))
    {
        divider_drag_ = DividerDrag{container->id(), divider->id()};
        return;
    }

    DropTarget hit = container->hit_test_drop_zone(p);
    if (!hit.target)
        return;
    const SplitContainer* owner = coordinator_.container_for_session(*hit.target);
    if (!owner)
        return;

    // A press on a pane header starts dragging that pane; elsewhere it only
    // focuses.
    const SplitNode* node = container->root()->find_node(*hit.target);
    if (node && p.y >= node->frame().top() - PANE_HEADER_SIZE)
    {
        gesture_ = coordinator_.begin_drag(*hit.target);
        TERMPANE_LOG_TRACE("view", "pane drag from header");
    }
    else
    {
        coordinator_.select_tab(owner->id(), *hit.target);
    }
}

}   // namespace termpane

#endif   // TERMPANE_USE_IMGUI
