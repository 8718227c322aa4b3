#include "tab_bar_model.hpp"

#include <algorithm>
#include <cstddef>

namespace termpane
{

bool TabBarModel::add_tab(TabDescriptor tab)
{
    if (index_of(tab.id))
    {
        return false;
    }
    tabs_.push_back(std::move(tab));
    notify_changed();
    return true;
}

bool TabBarModel::remove_tab(const SessionId& id)
{
    auto idx = index_of(id);
    if (!idx)
    {
        return false;
    }
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(*idx));
    if (selected_ == id)
    {
        selected_.reset();
    }
    notify_changed();
    return true;
}

bool TabBarModel::update_tab(const SessionId& id, const std::string& title, bool running)
{
    auto idx = index_of(id);
    if (!idx)
    {
        return false;
    }
    auto& tab = tabs_[*idx];
    if (tab.title == title && tab.running == running)
    {
        return true;
    }
    tab.title   = title;
    tab.running = running;
    notify_changed();
    return true;
}

bool TabBarModel::set_selected(const SessionId& id)
{
    if (!index_of(id))
    {
        return false;
    }
    if (selected_ != id)
    {
        selected_ = id;
        notify_changed();
    }
    return true;
}

void TabBarModel::clear_selection()
{
    if (selected_)
    {
        selected_.reset();
        notify_changed();
    }
}

bool TabBarModel::move_tab(size_t from, size_t to)
{
    if (from >= tabs_.size() || to >= tabs_.size())
    {
        return false;
    }
    if (from == to)
    {
        return true;
    }

    TabDescriptor moving = std::move(tabs_[from]);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(from));
    tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moving));
    notify_changed();
    return true;
}

std::optional<size_t> TabBarModel::index_of(const SessionId& id) const
{
    auto it = std::find_if(tabs_.begin(), tabs_.end(), [&id](const TabDescriptor& t) { return t.id == id; });
    if (it == tabs_.end())
    {
        return std::nullopt;
    }
    return static_cast<size_t>(it - tabs_.begin());
}

const TabDescriptor* TabBarModel::find(const SessionId& id) const
{
    auto idx = index_of(id);
    return idx ? &tabs_[*idx] : nullptr;
}

void TabBarModel::request_new_tab()
{
    if (on_new_tab_)
        on_new_tab_();
}

void TabBarModel::request_close_tab(const SessionId& id)
{
    if (on_close_tab_)
        on_close_tab_(id);
}

void TabBarModel::request_select_tab(const SessionId& id)
{
    if (on_select_tab_)
        on_select_tab_(id);
}

void TabBarModel::request_collapse_panel()
{
    if (on_collapse_panel_)
        on_collapse_panel_();
}

void TabBarModel::notify_changed()
{
    if (on_changed_)
        on_changed_();
}

}   // namespace termpane
