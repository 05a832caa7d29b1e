#pragma once

#include <orchestration/connection_registry.hpp>
#include <orchestration/session_cache.hpp>
#include <orchestration/store.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace Orchestration
{
    /**
     * @brief Opens, closes and orders the tabs and keeps track of the active one.
     */
    class TabRouter
    {
      public:
        TabRouter(
            std::shared_ptr<Store> store,
            std::shared_ptr<ConnectionRegistry> registry,
            std::shared_ptr<SessionCache> sessionCache);

        /**
         * @brief Opens the tab of a connection and activates it.
         *
         * The local pseudo-connection gets a new tab on every call. Any other connection reuses its existing
         * tab, switching it to the requested view. The connection is connected if it is disconnected or in
         * error.
         *
         * @return The id of the activated tab, nothing if the connection does not exist.
         */
        std::optional<Ids::TabId> openTab(
            Ids::ConnectionId const& connectionId,
            std::optional<TabView> const& view = std::nullopt);

        Ids::TabId openPortForwardingTab();
        Ids::TabId openSnippetsTab();
        Ids::TabId openSettingsTab();

        /**
         * @brief Closes the tab. When it was the last tab of a connected remote connection, that connection is
         * disconnected. When it was the last local tab, the local terminals are closed.
         */
        void closeTab(Ids::TabId const& tabId);
        void activateTab(Ids::TabId const& tabId);
        void setTabView(Ids::TabId const& tabId, TabView view);
        void reorderTabs(std::size_t oldIndex, std::size_t newIndex);

        std::vector<Tab> const& tabs() const;
        Tab const* activeTab() const;
        std::optional<Ids::ConnectionId> const& activeConnectionId() const;

      private:
        std::shared_ptr<Store> store_;
        std::shared_ptr<ConnectionRegistry> registry_;
        std::shared_ptr<SessionCache> sessionCache_;
    };
}
