#include "panel_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <termpane/logger.hpp>

#include "../core/session_id.hpp"

namespace termpane
{

PanelCoordinator::PanelCoordinator(SessionFactory& factory, TaskScheduler& scheduler, PanelConfig config)
    : factory_(factory), scheduler_(scheduler), config_(std::move(config))
{
    tab_bar_.set_on_new_tab([this]() { create_tab(); });
    tab_bar_.set_on_close_tab([this](const SessionId& id) { close_tab(id); });
    tab_bar_.set_on_select_tab([this](const SessionId& id) { select_tab(id); });
    tab_bar_.set_on_collapse_panel([this]() { toggle_collapsed(); });
}

PanelCoordinator::~PanelCoordinator()
{
    tabs_.clear();
    for (auto& [id, managed] : sessions_)
    {
        if (managed.pending_cd != TaskScheduler::INVALID_TASK)
        {
            scheduler_.cancel(managed.pending_cd);
        }
        managed.session->set_on_changed(nullptr);
        if (managed.session->is_running())
        {
            managed.session->terminate();
        }
    }
}

// ─── Sessions ────────────────────────────────────────────────────────────────

TerminalSession& PanelCoordinator::spawn_session()
{
    std::unique_ptr<TerminalSession> session = factory_.create(config_.session_options());
    if (!session)
    {
        TERMPANE_LOG_CRITICAL("panel", "session factory returned no session");
        throw std::runtime_error("termpane: session factory returned no session");
    }

    TerminalSession& ref = *session;
    ref.set_on_changed([this](TerminalSession& s) { on_session_changed(s); });
    sessions_.emplace(ref.id(), ManagedSession{std::move(session), TaskScheduler::INVALID_TASK});
    TERMPANE_LOG_DEBUG("panel", "session {} created", short_session_id(ref.id()));
    return ref;
}

void PanelCoordinator::start_session(TerminalSession& session)
{
    if (session.is_running())
    {
        return;
    }
    session.start();
    TERMPANE_LOG_DEBUG("panel", "session {} started", short_session_id(session.id()));

    if (!config_.working_directory)
    {
        return;
    }

    // After the shell has had a moment to initialize, move it to the
    // working directory. The session may be gone by then.
    auto it = sessions_.find(session.id());
    if (it == sessions_.end())
    {
        return;
    }
    if (it->second.pending_cd != TaskScheduler::INVALID_TASK)
    {
        scheduler_.cancel(it->second.pending_cd);
    }

    const SessionId        id       = session.id();
    const TerminalSession* expected = &session;
    const std::string      path     = *config_.working_directory;

    it->second.pending_cd = scheduler_.schedule_after(
        std::chrono::milliseconds(config_.initial_directory_delay_ms),
        [this, id, expected, path]()
        {
            auto current = sessions_.find(id);
            if (current == sessions_.end() || current->second.session.get() != expected)
            {
                TERMPANE_LOG_DEBUG("panel", "stale directory change for {} dropped", short_session_id(id));
                return;
            }
            current->second.pending_cd = TaskScheduler::INVALID_TASK;
            if (!current->second.session->is_running())
            {
                return;
            }
            current->second.session->send(change_directory_command(path));
        });
}

void PanelCoordinator::destroy_session(const SessionId& id)
{
    auto it = sessions_.find(id);
    if (it == sessions_.end())
    {
        return;
    }

    if (it->second.pending_cd != TaskScheduler::INVALID_TASK)
    {
        scheduler_.cancel(it->second.pending_cd);
    }
    std::unique_ptr<TerminalSession> session = std::move(it->second.session);
    sessions_.erase(it);

    session->set_on_changed(nullptr);
    session->terminate();
    if (focused_ == id)
    {
        focused_.clear();
    }
    TERMPANE_LOG_DEBUG("panel", "session {} terminated", short_session_id(id));
}

void PanelCoordinator::focus_session(TerminalSession& session)
{
    focused_ = session.id();
    if (on_focus_requested_)
    {
        on_focus_requested_(session);
    }
}

void PanelCoordinator::on_session_changed(TerminalSession& session)
{
    // Only a tab's own session drives its descriptor; other panes do not.
    tab_bar_.update_tab(session.id(), session.title(), session.is_running());
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

SplitContainer& PanelCoordinator::add_tab_container(TerminalSession& root)
{
    auto            container = std::make_unique<SplitContainer>(root.id(), root);
    SplitContainer& ref       = *container;
    configure_container(ref);
    tabs_.emplace(root.id(), std::move(container));
    return ref;
}

void PanelCoordinator::configure_container(SplitContainer& container)
{
    container.set_divider_thickness(config_.divider_thickness);
    container.set_min_pane_size(config_.min_pane_size);
    container.set_bounds(content_bounds_);
    container.set_visible(false);
    container.set_on_drop(
        [this](const SessionId& dragged, DropZone zone, const std::optional<SessionId>& target)
        { handle_drop(dragged, zone, target); });
}

SessionId PanelCoordinator::create_tab()
{
    TerminalSession& session = spawn_session();
    add_tab_container(session);
    tab_bar_.add_tab(TabDescriptor{session.id(), session.title(), session.is_running()});

    const SessionId id = session.id();
    TERMPANE_LOG_INFO("panel", "tab {} created ({} tabs)", short_session_id(id), tabs_.size());

    select_tab(id);
    start_session(session);
    return id;
}

std::optional<SessionId> PanelCoordinator::create_split(const SessionId& target, DropZone zone)
{
    SplitContainer* container = container_for_session(target);
    if (!container)
    {
        TERMPANE_LOG_DEBUG("panel", "split target {} not found", short_session_id(target));
        return std::nullopt;
    }

    TerminalSession& session = spawn_session();
    container->add_session(session, target, zone);

    TERMPANE_LOG_INFO("panel",
                      "split {} {} in tab {}",
                      short_session_id(target),
                      to_string(zone),
                      short_session_id(container->id()));

    start_session(session);
    focus_session(session);
    return session.id();
}

void PanelCoordinator::close_session(const SessionId& session_id)
{
    // Callers may pass a reference into state this call destroys.
    const SessionId id = session_id;

    SplitContainer* tab   = container_for_tab(id);
    SplitContainer* owner = container_for_session(id);

    // A tab id closes the tab, unless that session now lives in another tab.
    if (tab && (owner == tab || owner == nullptr))
    {
        close_tab(id);
        return;
    }
    if (!owner)
    {
        TERMPANE_LOG_DEBUG("panel", "close: {} not found", short_session_id(id));
        return;
    }

    const SessionId owner_id = owner->id();
    owner->remove_session(id);
    destroy_session(id);
    TERMPANE_LOG_INFO("panel", "pane {} closed in tab {}", short_session_id(id), short_session_id(owner_id));

    if (owner->is_empty())
    {
        close_tab(owner_id);
        return;
    }
    // Focus is panel-wide: a hidden tab gets its first pane focused by
    // select_tab when it is shown again.
    if (selected_tab() == owner_id)
    {
        if (TerminalSession* first = owner->first_session())
        {
            focus_session(*first);
        }
    }
}

void PanelCoordinator::close_tab(const SessionId& id)
{
    const SessionId tab_id = id;

    auto idx = tab_bar_.index_of(tab_id);
    if (!idx || !container_for_tab(tab_id))
    {
        TERMPANE_LOG_DEBUG("panel", "close: no tab {}", short_session_id(tab_id));
        return;
    }
    const bool was_selected = selected_tab() == tab_id;

    teardown_tab(tab_id, true);
    TERMPANE_LOG_INFO("panel", "tab {} closed ({} tabs)", short_session_id(tab_id), tabs_.size());

    if (was_selected)
    {
        select_after_removal(tab_id, *idx);
    }
}

void PanelCoordinator::close_selected_tab()
{
    if (auto selected = selected_tab())
    {
        close_tab(*selected);
    }
}

void PanelCoordinator::teardown_tab(const SessionId& tab_id, bool terminate)
{
    auto it = tabs_.find(tab_id);
    if (it == tabs_.end())
    {
        return;
    }

    std::vector<SessionId> ids;
    for (TerminalSession* s : it->second->all_sessions())
    {
        ids.push_back(s->id());
    }
    it->second->set_visible(false);

    // tab_id may refer into the container or the descriptor.
    const SessionId id = tab_id;
    tabs_.erase(it);
    tab_bar_.remove_tab(id);

    if (terminate)
    {
        for (const auto& sid : ids)
        {
            destroy_session(sid);
        }
    }
}

void PanelCoordinator::select_after_removal(const SessionId& removed_tab, size_t removed_index)
{
    const auto& tabs = tab_bar_.tabs();
    if (tabs.empty())
    {
        TERMPANE_LOG_DEBUG("panel", "last tab {} closed, opening a new one", short_session_id(removed_tab));
        create_tab();
        return;
    }
    size_t index = std::min(removed_index, tabs.size() - 1);
    SessionId next = tabs[index].id;
    select_tab(next);
}

bool PanelCoordinator::select_tab(const SessionId& tab_id, const std::optional<SessionId>& preferred)
{
    SplitContainer* container = container_for_tab(tab_id);
    if (!container)
    {
        TERMPANE_LOG_DEBUG("panel", "select: no tab {}", short_session_id(tab_id));
        return false;
    }

    auto previous = selected_tab();
    if (previous && *previous != tab_id)
    {
        if (SplitContainer* prev = container_for_tab(*previous))
        {
            prev->set_visible(false);
        }
    }

    tab_bar_.set_selected(tab_id);
    container->set_bounds(content_bounds_);
    container->set_visible(!collapsed_);

    TerminalSession* target = preferred ? container->find_session(*preferred) : nullptr;
    if (!target)
    {
        target = container->first_session();
    }
    if (!target)
    {
        return true;
    }

    focus_session(*target);
    start_session(*target);
    return true;
}

void PanelCoordinator::select_next()
{
    const auto& tabs     = tab_bar_.tabs();
    auto        selected = selected_tab();
    if (tabs.empty() || !selected)
    {
        return;
    }
    auto idx = tab_bar_.index_of(*selected);
    if (!idx)
    {
        return;
    }
    SessionId next = tabs[(*idx + 1) % tabs.size()].id;
    select_tab(next);
}

void PanelCoordinator::select_previous()
{
    const auto& tabs     = tab_bar_.tabs();
    auto        selected = selected_tab();
    if (tabs.empty() || !selected)
    {
        return;
    }
    auto idx = tab_bar_.index_of(*selected);
    if (!idx)
    {
        return;
    }
    SessionId previous = tabs[*idx == 0 ? tabs.size() - 1 : *idx - 1].id;
    select_tab(previous);
}

// ─── Drops ───────────────────────────────────────────────────────────────────

bool PanelCoordinator::handle_drop(const SessionId&                dragged,
                                   DropZone                        zone,
                                   const std::optional<SessionId>& target)
{
    SplitContainer*  source  = container_for_session(dragged);
    TerminalSession* session = find_session(dragged);
    if (!source || !session)
    {
        TERMPANE_LOG_DEBUG("drag", "drop: {} not found", short_session_id(dragged));
        return false;
    }

    SplitContainer* dest = target ? container_for_session(*target) : nullptr;
    if (!dest)
    {
        if (auto selected = selected_tab())
        {
            dest = container_for_tab(*selected);
        }
    }
    if (!dest)
    {
        return false;
    }

    // A pane dropped onto its own center, or the only pane of a tab dropped
    // back into that tab, stays where it is. An edge drop onto itself falls
    // through: the pane leaves, the target is gone, and it re-splits the root.
    if (target && *target == dragged && zone == DropZone::Center)
    {
        TERMPANE_LOG_DEBUG("drag", "drop of {} onto itself ignored", short_session_id(dragged));
        return false;
    }
    if (source == dest && source->pane_count() < 2)
    {
        return false;
    }

    const SessionId source_id = source->id();
    const SessionId dest_id   = dest->id();

    if (source != dest && source_id == dragged && source->pane_count() == 1)
    {
        // Single-pane tab merged into another tab: the session moves, its
        // tab goes away without terminating it.
        source->remove_session(dragged);
        teardown_tab(source_id, false);
        dest->add_session(*session, target, zone);
        TERMPANE_LOG_INFO("drag",
                          "tab {} merged into tab {} at {}",
                          short_session_id(source_id),
                          short_session_id(dest_id),
                          to_string(zone));
    }
    else
    {
        source->remove_session(dragged);
        dest->add_session(*session, target, zone);
        TERMPANE_LOG_INFO("drag",
                          "pane {} moved from tab {} to tab {} at {}",
                          short_session_id(dragged),
                          short_session_id(source_id),
                          short_session_id(dest_id),
                          to_string(zone));

        if (source != dest && source->is_empty())
        {
            teardown_tab(source_id, false);
        }
    }

    if (selected_tab() != dest_id)
    {
        select_tab(dest_id, dragged);
    }
    else
    {
        dest->set_visible(!collapsed_);
        focus_session(*session);
    }
    return true;
}

void PanelCoordinator::update_working_directory(const std::string& path)
{
    config_.working_directory = path;

    size_t moved = 0;
    for (const auto& tab : tab_bar_.tabs())
    {
        SplitContainer* container = container_for_tab(tab.id);
        if (!container)
            continue;
        for (TerminalSession* s : container->all_sessions())
        {
            if (s->is_running())
            {
                s->change_directory(path);
                ++moved;
            }
        }
    }
    TERMPANE_LOG_DEBUG("panel", "working directory now {} ({} sessions moved)", path, moved);
}

// ─── Drag gestures ───────────────────────────────────────────────────────────

DragGesture PanelCoordinator::begin_drag(const SessionId& id)
{
    DragGesture gesture;
    if (!find_session(id))
    {
        TERMPANE_LOG_DEBUG("drag", "drag of unknown pane {}", short_session_id(id));
        return gesture;
    }
    gesture.state   = DragGesture::State::Dragging;
    gesture.payload = DragPayload::encode(id);
    TERMPANE_LOG_DEBUG("drag", "drag of {} started", short_session_id(id));
    return gesture;
}

void PanelCoordinator::update_drag(DragGesture& gesture, Point point)
{
    auto selected = selected_tab();
    if (!gesture.is_active() || !selected || collapsed_)
    {
        return;
    }
    if (SplitContainer* container = container_for_tab(*selected))
    {
        container->drag_updated(gesture, point);
    }
}

void PanelCoordinator::exit_drag(DragGesture& gesture)
{
    if (owns_container(gesture.hovered))
    {
        gesture.hovered->drag_exited(gesture);
    }
    else
    {
        gesture.hovered = nullptr;
        gesture.target  = DropTarget{};
    }
}

bool PanelCoordinator::end_drag(DragGesture& gesture)
{
    SplitContainer* container = gesture.hovered;
    if (!gesture.is_active() || !owns_container(container))
    {
        gesture.clear();
        return false;
    }
    return container->perform_drop(gesture);
}

void PanelCoordinator::cancel_drag(DragGesture& gesture)
{
    exit_drag(gesture);
    gesture.clear();
    TERMPANE_LOG_DEBUG("drag", "drag cancelled");
}

bool PanelCoordinator::owns_container(const SplitContainer* container) const
{
    if (!container)
        return false;
    return std::any_of(tabs_.begin(),
                       tabs_.end(),
                       [container](const auto& entry) { return entry.second.get() == container; });
}

// ─── Panel ───────────────────────────────────────────────────────────────────

void PanelCoordinator::set_content_bounds(const Rect& bounds)
{
    content_bounds_ = bounds;
    if (auto selected = selected_tab())
    {
        if (SplitContainer* container = container_for_tab(*selected))
        {
            container->set_bounds(bounds);
        }
    }
}

void PanelCoordinator::set_collapsed(bool collapsed)
{
    if (collapsed_ == collapsed)
    {
        return;
    }
    collapsed_ = collapsed;
    TERMPANE_LOG_DEBUG("panel", "panel {}", collapsed ? "collapsed" : "expanded");

    auto selected = selected_tab();
    if (!selected)
    {
        return;
    }
    if (collapsed)
    {
        if (SplitContainer* container = container_for_tab(*selected))
        {
            container->set_visible(false);
        }
        return;
    }

    std::optional<SessionId> preferred;
    if (!focused_.empty())
    {
        preferred = focused_;
    }
    select_tab(*selected, preferred);
}

// ─── Queries ─────────────────────────────────────────────────────────────────

TerminalSession* PanelCoordinator::focused_session() const
{
    return focused_.empty() ? nullptr : find_session(focused_);
}

std::vector<SessionId> PanelCoordinator::tab_ids() const
{
    std::vector<SessionId> ids;
    ids.reserve(tab_bar_.count());
    for (const auto& tab : tab_bar_.tabs())
    {
        ids.push_back(tab.id);
    }
    return ids;
}

SplitContainer* PanelCoordinator::container_for_tab(const SessionId& tab_id) const
{
    auto it = tabs_.find(tab_id);
    return it == tabs_.end() ? nullptr : it->second.get();
}

SplitContainer* PanelCoordinator::container_for_session(const SessionId& id) const
{
    for (const auto& [tab_id, container] : tabs_)
    {
        if (container->contains(id))
        {
            return container.get();
        }
    }
    return nullptr;
}

TerminalSession* PanelCoordinator::find_session(const SessionId& id) const
{
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.session.get();
}

}   // namespace termpane
