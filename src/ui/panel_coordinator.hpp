#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <termpane/fwd.hpp>
#include <termpane/geometry.hpp>
#include <termpane/session.hpp>
#include <unordered_map>
#include <vector>

#include "../core/task_scheduler.hpp"
#include "drag_payload.hpp"
#include "drop_zone.hpp"
#include "panel_config.hpp"
#include "split_container.hpp"
#include "tab_bar_model.hpp"

namespace termpane
{

/**
 * PanelCoordinator: owns every session and every tab of one terminal panel.
 *
 * Each tab is a SplitContainer identified by the id of the session it was
 * created for. Routes tab bar requests and pane drops, moves sessions
 * between trees, and mirrors single-pane session state into the tab bar.
 * The panel always has at least one tab once the first one exists.
 */
class PanelCoordinator
{
   public:
    using FocusCallback = std::function<void(TerminalSession& session)>;

    PanelCoordinator(SessionFactory& factory, TaskScheduler& scheduler, PanelConfig config = {});
    ~PanelCoordinator();

    PanelCoordinator(const PanelCoordinator&)            = delete;
    PanelCoordinator& operator=(const PanelCoordinator&) = delete;

    // ── Tabs ────────────────────────────────────────────────────────────

    // New session in a new tab; selects it and starts the session.
    SessionId create_tab();

    // New session split off the pane holding target. Does not change the
    // selected tab. Returns the new session id, or nullopt if target is
    // unknown.
    std::optional<SessionId> create_split(const SessionId& target, DropZone zone);

    // Close a tab (when id identifies one) or a single nested pane.
    void close_session(const SessionId& id);

    // Tear down a whole tab, terminating all of its panes.
    void close_tab(const SessionId& tab_id);
    void close_selected_tab();

    // Show a tab and focus preferred (if it lives there) or its first pane,
    // starting that pane's session if needed. Returns false for unknown tabs.
    bool select_tab(const SessionId& tab_id, const std::optional<SessionId>& preferred = std::nullopt);
    void select_next();
    void select_previous();

    // Apply a pane drop. Returns false when nothing changed.
    bool handle_drop(const SessionId& dragged, DropZone zone, const std::optional<SessionId>& target);

    // Remember path for new sessions and move every running session there.
    void update_working_directory(const std::string& path);

    // ── Drag gestures ───────────────────────────────────────────────────

    // Start dragging a pane. An unknown id yields an idle gesture.
    DragGesture begin_drag(const SessionId& id);

    // Hover over the visible tab at point (panel content coordinates).
    void update_drag(DragGesture& gesture, Point point);
    void exit_drag(DragGesture& gesture);
    bool end_drag(DragGesture& gesture);
    void cancel_drag(DragGesture& gesture);

    // ── Panel ───────────────────────────────────────────────────────────

    void set_content_bounds(const Rect& bounds);
    Rect content_bounds() const { return content_bounds_; }

    // Expanding refocuses the selected tab and starts its pane.
    void set_collapsed(bool collapsed);
    void toggle_collapsed() { set_collapsed(!collapsed_); }
    bool is_collapsed() const { return collapsed_; }

    // ── Queries ─────────────────────────────────────────────────────────

    TerminalSession*         focused_session() const;
    std::optional<SessionId> selected_tab() const { return tab_bar_.selected_id(); }
    std::vector<SessionId>   tab_ids() const;
    size_t                   tab_count() const { return tabs_.size(); }
    size_t                   session_count() const { return sessions_.size(); }

    TabBarModel&       tab_bar() { return tab_bar_; }
    const TabBarModel& tab_bar() const { return tab_bar_; }

    SplitContainer*  container_for_tab(const SessionId& tab_id) const;
    SplitContainer*  container_for_session(const SessionId& id) const;
    TerminalSession* find_session(const SessionId& id) const;

    const PanelConfig& config() const { return config_; }

    void set_on_focus_requested(FocusCallback cb) { on_focus_requested_ = std::move(cb); }

   private:
    struct ManagedSession
    {
        std::unique_ptr<TerminalSession> session;
        TaskScheduler::TaskId            pending_cd = TaskScheduler::INVALID_TASK;
    };

    TerminalSession& spawn_session();
    void             start_session(TerminalSession& session);
    void             destroy_session(const SessionId& id);
    void             focus_session(TerminalSession& session);
    void             on_session_changed(TerminalSession& session);

    SplitContainer& add_tab_container(TerminalSession& root);
    void            configure_container(SplitContainer& container);

    // Drop the tab entry. Sessions are terminated only when terminate is set.
    void teardown_tab(const SessionId& tab_id, bool terminate);
    void select_after_removal(const SessionId& removed_tab, size_t removed_index);
    bool owns_container(const SplitContainer* container) const;

    SessionFactory& factory_;
    TaskScheduler&  scheduler_;
    PanelConfig     config_;

    std::unordered_map<SessionId, ManagedSession>                  sessions_;
    std::unordered_map<SessionId, std::unique_ptr<SplitContainer>> tabs_;
    TabBarModel                                                    tab_bar_;

    SessionId focused_;
    Rect      content_bounds_{};
    bool      collapsed_ = false;

    FocusCallback on_focus_requested_;
};

}   // namespace termpane
