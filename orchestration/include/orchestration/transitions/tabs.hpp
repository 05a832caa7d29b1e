#pragma once

#include <orchestration/state.hpp>

#include <cstddef>
#include <optional>

namespace Orchestration::Transitions
{
    struct OpenedTab
    {
        State state;
        Ids::TabId tabId;
        // false if an existing tab was reused
        bool created;
    };

    /**
     * @brief Opens the tab of a remote connection. An existing connection tab for the same id is reused and
     * activated, switching it to the requested view.
     *
     * @param newTabId Id to use if a new tab has to be created.
     */
    OpenedTab openConnectionTab(
        State state,
        Ids::ConnectionId const& connectionId,
        std::optional<TabView> const& view,
        Ids::TabId const& newTabId);

    /// Local terminals are never reused, every call creates a tab.
    OpenedTab openLocalTab(State state, Ids::TabId const& newTabId);

    OpenedTab openPortForwardingTab(State state, Ids::TabId const& newTabId);
    OpenedTab openSnippetsTab(State state, Ids::TabId const& newTabId);
    OpenedTab openSettingsTab(State state, Ids::TabId const& newTabId);

    /// Removes the tab. If it was active, the last remaining tab becomes active.
    State closeTab(State state, Ids::TabId const& tabId);
    State activateTab(State state, Ids::TabId const& tabId);
    State setTabView(State state, Ids::TabId const& tabId, TabView view);
    /// Moves the tab at oldIndex to newIndex. Out of range indices leave the state untouched.
    State reorderTabs(State state, std::size_t oldIndex, std::size_t newIndex);
}
