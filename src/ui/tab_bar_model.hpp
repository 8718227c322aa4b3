#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <termpane/fwd.hpp>
#include <vector>

namespace termpane
{

struct TabDescriptor
{
    SessionId   id;
    std::string title;
    bool        running = false;
};

// ─── TabBarModel ─────────────────────────────────────────────────────────────
// Ordered tab descriptors plus the selection, driving a stateless tab bar.
// The presentation calls the request_* entry points; the panel coordinator
// reacts through the on_* callbacks and writes the model back.

class TabBarModel
{
   public:
    using ChangedCallback = std::function<void()>;
    using NewTabCallback  = std::function<void()>;
    using TabCallback     = std::function<void(const SessionId& id)>;
    using CollapseCallback = std::function<void()>;

    TabBarModel()  = default;
    ~TabBarModel() = default;

    TabBarModel(const TabBarModel&)            = delete;
    TabBarModel& operator=(const TabBarModel&) = delete;

    // ── Model ───────────────────────────────────────────────────────────

    const std::vector<TabDescriptor>& tabs() const { return tabs_; }
    size_t                            count() const { return tabs_.size(); }
    const std::optional<SessionId>&   selected_id() const { return selected_; }

    // Appends; a duplicate id is ignored (returns false).
    bool add_tab(TabDescriptor tab);
    bool remove_tab(const SessionId& id);
    bool update_tab(const SessionId& id, const std::string& title, bool running);
    bool set_selected(const SessionId& id);
    void clear_selection();

    // Move the tab at index from to index to. Selection follows identity.
    bool move_tab(size_t from, size_t to);

    std::optional<size_t> index_of(const SessionId& id) const;
    const TabDescriptor*  find(const SessionId& id) const;

    // ── Presentation entry points ───────────────────────────────────────

    void request_new_tab();
    void request_close_tab(const SessionId& id);
    void request_select_tab(const SessionId& id);
    void request_collapse_panel();

    void set_on_new_tab(NewTabCallback cb) { on_new_tab_ = std::move(cb); }
    void set_on_close_tab(TabCallback cb) { on_close_tab_ = std::move(cb); }
    void set_on_select_tab(TabCallback cb) { on_select_tab_ = std::move(cb); }
    void set_on_collapse_panel(CollapseCallback cb) { on_collapse_panel_ = std::move(cb); }

    // Fires after every model mutation.
    void set_on_changed(ChangedCallback cb) { on_changed_ = std::move(cb); }

   private:
    void notify_changed();

    std::vector<TabDescriptor> tabs_;
    std::optional<SessionId>   selected_;

    NewTabCallback   on_new_tab_;
    TabCallback      on_close_tab_;
    TabCallback      on_select_tab_;
    CollapseCallback on_collapse_panel_;
    ChangedCallback  on_changed_;
};

}   // namespace termpane
