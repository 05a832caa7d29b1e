#include <orchestration/transitions/tabs.hpp>

#include <algorithm>

namespace Orchestration::Transitions
{
    namespace
    {
        void syncActiveConnection(State& state)
        {
            auto const* tab = state.activeTab();
            state.activeConnectionId = tab ? tab->connectionId : std::nullopt;
        }

        template <typename PredicateT>
        OpenedTab openSingleton(State state, Ids::TabId const& newTabId, PredicateT&& matches, Tab tab)
        {
            auto iter = std::find_if(state.tabs.begin(), state.tabs.end(), matches);
            if (iter != state.tabs.end())
            {
                const auto id = iter->id;
                return OpenedTab{.state = activateTab(std::move(state), id), .tabId = id, .created = false};
            }
            tab.id = newTabId;
            state.tabs.push_back(std::move(tab));
            return OpenedTab{.state = activateTab(std::move(state), newTabId), .tabId = newTabId, .created = true};
        }
    }

    OpenedTab openConnectionTab(
        State state,
        Ids::ConnectionId const& connectionId,
        std::optional<TabView> const& view,
        Ids::TabId const& newTabId)
    {
        auto iter = std::find_if(state.tabs.begin(), state.tabs.end(), [&](Tab const& tab) {
            return tab.type == TabType::Connection && tab.connectionId == connectionId;
        });
        if (iter != state.tabs.end())
        {
            if (view && iter->view != *view)
                iter->view = *view;
            const auto id = iter->id;
            return OpenedTab{.state = activateTab(std::move(state), id), .tabId = id, .created = false};
        }

        auto const* connection = state.findConnection(connectionId);
        state.tabs.push_back(Tab{
            .id = newTabId,
            .type = TabType::Connection,
            .title = connection ? connection->record.displayName() : connectionId.value(),
            .connectionId = connectionId,
            .view = view.value_or(TabView::Terminal),
        });
        return OpenedTab{.state = activateTab(std::move(state), newTabId), .tabId = newTabId, .created = true};
    }

    OpenedTab openLocalTab(State state, Ids::TabId const& newTabId)
    {
        state.tabs.push_back(Tab{
            .id = newTabId,
            .type = TabType::Connection,
            .title = "Local Terminal",
            .connectionId = Ids::localConnectionId(),
            .view = TabView::Terminal,
        });
        return OpenedTab{.state = activateTab(std::move(state), newTabId), .tabId = newTabId, .created = true};
    }

    OpenedTab openPortForwardingTab(State state, Ids::TabId const& newTabId)
    {
        return openSingleton(
            std::move(state),
            newTabId,
            [](Tab const& tab) {
                return tab.type == TabType::PortForwarding;
            },
            Tab{.type = TabType::PortForwarding, .title = "Port Forwarding", .view = TabView::PortForwarding});
    }

    OpenedTab openSnippetsTab(State state, Ids::TabId const& newTabId)
    {
        return openSingleton(
            std::move(state),
            newTabId,
            [](Tab const& tab) {
                return tab.connectionId == Ids::localConnectionId() && tab.view == TabView::Snippets;
            },
            Tab{
                .type = TabType::Connection,
                .title = "Global Snippets",
                .connectionId = Ids::localConnectionId(),
                .view = TabView::Snippets,
            });
    }

    OpenedTab openSettingsTab(State state, Ids::TabId const& newTabId)
    {
        return openSingleton(
            std::move(state),
            newTabId,
            [](Tab const& tab) {
                return tab.type == TabType::Settings;
            },
            Tab{.type = TabType::Settings, .title = "Settings", .view = TabView::Dashboard});
    }

    State closeTab(State state, Ids::TabId const& tabId)
    {
        std::erase_if(state.tabs, [&tabId](Tab const& tab) {
            return tab.id == tabId;
        });
        if (state.activeTabId == tabId || (state.activeTabId && state.findTab(*state.activeTabId) == nullptr))
        {
            if (state.tabs.empty())
                state.activeTabId = std::nullopt;
            else
                state.activeTabId = state.tabs.back().id;
        }
        syncActiveConnection(state);
        return state;
    }

    State activateTab(State state, Ids::TabId const& tabId)
    {
        if (state.findTab(tabId) == nullptr)
            return state;
        state.activeTabId = tabId;
        syncActiveConnection(state);
        return state;
    }

    State setTabView(State state, Ids::TabId const& tabId, TabView view)
    {
        for (auto& tab : state.tabs)
        {
            if (tab.id == tabId)
                tab.view = view;
        }
        return state;
    }

    State reorderTabs(State state, std::size_t oldIndex, std::size_t newIndex)
    {
        if (oldIndex >= state.tabs.size() || newIndex >= state.tabs.size() || oldIndex == newIndex)
            return state;

        auto moved = std::move(state.tabs[oldIndex]);
        state.tabs.erase(state.tabs.begin() + static_cast<std::ptrdiff_t>(oldIndex));
        state.tabs.insert(state.tabs.begin() + static_cast<std::ptrdiff_t>(newIndex), std::move(moved));
        return state;
    }
}
