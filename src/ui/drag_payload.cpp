#include "drag_payload.hpp"

#include <algorithm>
#include <cctype>

#include "../core/session_id.hpp"

namespace termpane
{

DragPayload DragPayload::encode(const SessionId& id)
{
    DragPayload payload;
    payload.set(PANE_TYPE, id);
    payload.set(PLAIN_TEXT_TYPE, id);
    return payload;
}

void DragPayload::set(std::string_view type, std::string data)
{
    auto it = std::find_if(items.begin(), items.end(), [type](const Item& i) { return i.type == type; });
    if (it != items.end())
    {
        it->data = std::move(data);
        return;
    }
    items.push_back(Item{std::string(type), std::move(data)});
}

const std::string* DragPayload::find(std::string_view type) const
{
    for (const auto& item : items)
    {
        if (item.type == type)
            return &item.data;
    }
    return nullptr;
}

std::optional<SessionId> DragPayload::decode() const
{
    // The plain-text item is only consulted when the pane type is absent.
    const std::string* data = find(PANE_TYPE);
    if (!data)
        data = find(PLAIN_TEXT_TYPE);
    if (!data)
        return std::nullopt;

    // Tolerate surrounding whitespace from plain-text sources.
    auto begin = data->find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return std::nullopt;
    auto end = data->find_last_not_of(" \t\r\n");

    std::string text = data->substr(begin, end - begin + 1);
    if (!is_valid_session_id(text))
        return std::nullopt;

    std::transform(text.begin(),
                   text.end(),
                   text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}   // namespace termpane
