#pragma once

#include <gateway/backend_gateway.hpp>
#include <orchestration/session_cache.hpp>
#include <orchestration/store.hpp>
#include <orchestration/tunnel_manager.hpp>
#include <persistence/state_holder.hpp>

#include <boost/signals2.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Orchestration
{
    /**
     * @brief Known connections, their runtime status and their persistence.
     */
    class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry>
    {
      public:
        /// Receives true if the connection ended up connected.
        using ConnectHandler = std::function<void(bool)>;

        ConnectionRegistry(
            std::shared_ptr<Gateway::BackendGateway> gateway,
            std::shared_ptr<Store> store,
            std::shared_ptr<SessionCache> sessionCache,
            std::shared_ptr<TunnelManager> tunnelManager);
        ConnectionRegistry(ConnectionRegistry const&) = delete;
        ConnectionRegistry& operator=(ConnectionRegistry const&) = delete;
        ConnectionRegistry(ConnectionRegistry&&) = delete;
        ConnectionRegistry& operator=(ConnectionRegistry&&) = delete;
        ~ConnectionRegistry() = default;

        /**
         * @brief Connects the connection, connecting its jump host first if necessary.
         *
         * Succeeds immediately for the local pseudo-connection and for connections that are already connected.
         * A second call while a connect for the same id is in flight joins the first one.
         * Jump chains that are cyclic, too deep or reference a missing connection fail without contacting
         * the backend.
         */
        void connect(Ids::ConnectionId const& id, ConnectHandler onComplete = {});

        /**
         * @brief Disconnects and releases the terminals of the connection. The connection always ends up
         * disconnected, even if the backend reports an error.
         */
        void disconnect(Ids::ConnectionId const& id, std::function<void()> onComplete = {});

        /**
         * @brief Loads the connections document from the backend. Every status starts out disconnected.
         * Loaded options replace the runtime options.
         */
        void loadConnections(std::function<void(bool)> onLoaded = {});
        void saveConnections();

        void addConnection(Persistence::Connection const& connection, bool temporary = false);
        void editConnection(Persistence::Connection const& connection);
        /// Disconnects first if connected, then removes the connection with all its tabs.
        void deleteConnection(Ids::ConnectionId const& id);
        void importConnections(std::vector<Persistence::Connection> const& connections);
        void clearConnections();

        void addFolder(std::string const& name, std::vector<std::string> const& tags = {});
        void deleteFolder(std::string const& name);
        void renameFolder(
            std::string const& oldName,
            std::string const& newName,
            std::optional<std::vector<std::string>> const& newTags = std::nullopt);
        void updateConnectionFolder(Ids::ConnectionId const& id, std::optional<std::string> const& folder);
        void toggleFavorite(Ids::ConnectionId const& id);
        void toggleConnectionFeature(Ids::ConnectionId const& id, std::string const& feature);

        std::vector<ConnectionEntry> const& connections() const;
        ConnectionEntry const* find(Ids::ConnectionId const& id) const;

      private:
        void issueConnect(Ids::ConnectionId const& id, SharedData::ConnectionConfig const& config);
        void onConnected(Ids::ConnectionId const& id, Gateway::ConnectResult const& result);
        void failConnect(Ids::ConnectionId const& id, std::string const& message);
        void completePending(Ids::ConnectionId const& id, bool connected);
        void fetchHomePath(Ids::ConnectionId const& id);
        void onStatusChange(SharedData::ConnectionStatusChange const& event);
        std::string displayNameOf(Ids::ConnectionId const& id) const;

        template <typename FunctionT>
        void transitionAndSave(FunctionT&& fn)
        {
            store_->transition(std::forward<FunctionT>(fn));
            saveConnections();
        }

      private:
        std::shared_ptr<Gateway::BackendGateway> gateway_;
        std::shared_ptr<Store> store_;
        std::shared_ptr<SessionCache> sessionCache_;
        std::shared_ptr<TunnelManager> tunnelManager_;
        Persistence::StateHolder stateHolder_{};
        std::unordered_map<Ids::ConnectionId, std::vector<ConnectHandler>, Ids::IdHash> pendingConnects_{};
        boost::signals2::scoped_connection statusSubscription_{};
    };
}
