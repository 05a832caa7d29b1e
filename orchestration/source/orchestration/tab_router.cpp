#include <orchestration/tab_router.hpp>
#include <orchestration/transitions/tabs.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Orchestration
{
    namespace
    {
        template <typename FunctionT>
        Ids::TabId openWith(Store& store, FunctionT&& open)
        {
            const auto newTabId = Ids::generateTabId();
            Ids::TabId result = newTabId;
            store.transition([&](State state) {
                auto opened = open(std::move(state), newTabId);
                result = opened.tabId;
                return std::move(opened.state);
            });
            return result;
        }
    }

    TabRouter::TabRouter(
        std::shared_ptr<Store> store,
        std::shared_ptr<ConnectionRegistry> registry,
        std::shared_ptr<SessionCache> sessionCache)
        : store_{std::move(store)}
        , registry_{std::move(registry)}
        , sessionCache_{std::move(sessionCache)}
    {}

    std::optional<Ids::TabId>
    TabRouter::openTab(Ids::ConnectionId const& connectionId, std::optional<TabView> const& view)
    {
        if (Ids::isLocal(connectionId))
        {
            auto tabId = openWith(*store_, [](State state, Ids::TabId const& newTabId) {
                return Transitions::openLocalTab(std::move(state), newTabId);
            });
            if (view)
                setTabView(tabId, *view);
            return tabId;
        }

        auto const* entry = store_->state().findConnection(connectionId);
        if (entry == nullptr)
        {
            Log::warn("Cannot open a tab for unknown connection '{}'.", connectionId.value());
            return std::nullopt;
        }
        const auto status = entry->status;

        auto tabId = openWith(*store_, [&](State state, Ids::TabId const& newTabId) {
            return Transitions::openConnectionTab(std::move(state), connectionId, view, newTabId);
        });

        if (status == SharedData::ConnectionStatus::Disconnected || status == SharedData::ConnectionStatus::Error)
            registry_->connect(connectionId);
        return tabId;
    }

    Ids::TabId TabRouter::openPortForwardingTab()
    {
        return openWith(*store_, [](State state, Ids::TabId const& newTabId) {
            return Transitions::openPortForwardingTab(std::move(state), newTabId);
        });
    }

    Ids::TabId TabRouter::openSnippetsTab()
    {
        return openWith(*store_, [](State state, Ids::TabId const& newTabId) {
            return Transitions::openSnippetsTab(std::move(state), newTabId);
        });
    }

    Ids::TabId TabRouter::openSettingsTab()
    {
        return openWith(*store_, [](State state, Ids::TabId const& newTabId) {
            return Transitions::openSettingsTab(std::move(state), newTabId);
        });
    }

    void TabRouter::closeTab(Ids::TabId const& tabId)
    {
        auto const* tab = store_->state().findTab(tabId);
        if (tab == nullptr)
            return;
        const auto connectionId = tab->connectionId;
        const bool snippets = tab->view == TabView::Snippets;

        store_->transition([&](State state) {
            return Transitions::closeTab(std::move(state), tabId);
        });

        // the global snippets tab is bound to the local connection but shows no terminal
        if (!connectionId || snippets)
            return;

        auto const& tabs = store_->state().tabs;
        const bool stillOpen = std::any_of(tabs.begin(), tabs.end(), [&](Tab const& other) {
            return other.connectionId == connectionId && other.view != TabView::Snippets;
        });
        if (stillOpen)
            return;

        if (Ids::isLocal(*connectionId))
        {
            sessionCache_->clearTerminals(*connectionId);
            return;
        }

        auto const* entry = store_->state().findConnection(*connectionId);
        if (entry != nullptr && entry->status == SharedData::ConnectionStatus::Connected)
            registry_->disconnect(*connectionId);
    }

    void TabRouter::activateTab(Ids::TabId const& tabId)
    {
        store_->transition([&](State state) {
            return Transitions::activateTab(std::move(state), tabId);
        });
    }

    void TabRouter::setTabView(Ids::TabId const& tabId, TabView view)
    {
        store_->transition([&](State state) {
            return Transitions::setTabView(std::move(state), tabId, view);
        });
    }

    void TabRouter::reorderTabs(std::size_t oldIndex, std::size_t newIndex)
    {
        store_->transition([&](State state) {
            return Transitions::reorderTabs(std::move(state), oldIndex, newIndex);
        });
    }

    std::vector<Tab> const& TabRouter::tabs() const
    {
        return store_->state().tabs;
    }

    Tab const* TabRouter::activeTab() const
    {
        return store_->state().activeTab();
    }

    std::optional<Ids::ConnectionId> const& TabRouter::activeConnectionId() const
    {
        return store_->state().activeConnectionId;
    }
}
