#pragma once

#include <gateway/backend_gateway.hpp>
#include <ids/ids.hpp>
#include <orchestration/store.hpp>

#include <boost/signals2.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace Orchestration
{
    /**
     * @brief Whatever currently displays a terminal. Surfaces come and go with the UI, the resource behind
     * them stays.
     */
    class TerminalSurface
    {
      public:
        virtual ~TerminalSurface() = default;

        virtual void write(std::string const& data) = 0;
        virtual void exited(std::optional<int> exitCode) = 0;
    };

    /**
     * @brief The live side of one terminal session. Owned exclusively by the SessionCache.
     */
    class TerminalResource
    {
      public:
        TerminalResource(Ids::SessionId sessionId, Ids::ConnectionId owner, std::size_t scrollbackLimit);
        TerminalResource(TerminalResource const&) = delete;
        TerminalResource& operator=(TerminalResource const&) = delete;
        TerminalResource(TerminalResource&&) = delete;
        TerminalResource& operator=(TerminalResource&&) = delete;
        ~TerminalResource() = default;

        Ids::SessionId const& sessionId() const
        {
            return sessionId_;
        }
        Ids::ConnectionId const& owner() const
        {
            return owner_;
        }

        /**
         * @brief Attaches an output surface, replacing the previous one. The retained scrollback is replayed
         * into it first.
         */
        void attach(TerminalSurface& surface);

        /**
         * @brief Detaches the given surface. Does nothing if another surface was attached in the meantime.
         */
        void detach(TerminalSurface const& surface);
        bool attached() const;

        std::string const& scrollback() const
        {
            return scrollback_;
        }
        bool spawned() const
        {
            return spawned_;
        }
        std::optional<std::string> const& spawnError() const
        {
            return spawnError_;
        }
        bool exited() const
        {
            return exited_;
        }
        std::optional<int> exitCode() const
        {
            return exitCode_;
        }

      private:
        friend class SessionCache;

        void feed(std::string const& data);
        void markExited(std::optional<int> exitCode);

      private:
        Ids::SessionId sessionId_;
        Ids::ConnectionId owner_;
        std::size_t scrollbackLimit_;
        std::string scrollback_{};
        TerminalSurface* surface_{nullptr};
        bool spawned_{false};
        std::optional<std::string> spawnError_{std::nullopt};
        bool exited_{false};
        std::optional<int> exitCode_{std::nullopt};
        boost::signals2::scoped_connection dataSubscription_{};
        boost::signals2::scoped_connection exitSubscription_{};
    };

    /**
     * @brief Keyed pool of live terminal resources. A resource is created on first acquire and lives until it
     * is released explicitly, no matter how often the UI attaches and detaches.
     *
     * For every session id there is at most one spawn request and at most one push event subscription.
     */
    class SessionCache : public std::enable_shared_from_this<SessionCache>
    {
      public:
        SessionCache(std::shared_ptr<Gateway::BackendGateway> gateway, std::shared_ptr<Store> store);
        SessionCache(SessionCache const&) = delete;
        SessionCache& operator=(SessionCache const&) = delete;
        SessionCache(SessionCache&&) = delete;
        SessionCache& operator=(SessionCache&&) = delete;
        ~SessionCache() = default;

        /**
         * @brief Returns the resource of the session, creating it and subscribing to its output if it does
         * not exist yet.
         *
         * @param surface Attached to the resource if given.
         */
        TerminalResource& acquire(
            Ids::SessionId const& sessionId,
            Ids::ConnectionId const& owner,
            TerminalSurface* surface = nullptr);

        /**
         * @brief Sends the spawn request unless it was already sent for this session. The spawned flag is set
         * before the request goes out.
         */
        void ensureSpawned(Ids::SessionId const& sessionId, Ids::ConnectionId const& connectionId, int rows, int cols);

        void write(Ids::SessionId const& sessionId, std::string const& data);
        void resize(Ids::SessionId const& sessionId, int rows, int cols);

        /**
         * @brief Disposes the resource and unregisters its subscriptions. Does not close the backend session.
         */
        void release(Ids::SessionId const& sessionId);
        void releaseAllOf(Ids::ConnectionId const& owner);

        bool contains(Ids::SessionId const& sessionId) const;
        TerminalResource* find(Ids::SessionId const& sessionId);
        std::size_t size() const;

        /// Creates a new terminal entry "Terminal N" for the connection and returns its session id.
        Ids::SessionId createTerminal(Ids::ConnectionId const& connectionId);
        /// Returns the active terminal of the connection, creating one if there is none.
        Ids::SessionId ensureTerminal(Ids::ConnectionId const& connectionId);
        void setActiveTerminal(Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId);
        /// Closes the backend session, releases the resource and removes the entry.
        void closeTerminal(Ids::ConnectionId const& connectionId, Ids::SessionId const& sessionId);
        /**
         * @brief Releases every terminal of the connection and removes their entries.
         *
         * @param closeSessions Also close the backend sessions. Not needed when the connection itself is gone.
         */
        void clearTerminals(Ids::ConnectionId const& connectionId, bool closeSessions = true);

      private:
        void closeSession(TerminalResource const& resource);

      private:
        std::shared_ptr<Gateway::BackendGateway> gateway_;
        std::shared_ptr<Store> store_;
        std::unordered_map<Ids::SessionId, std::unique_ptr<TerminalResource>, Ids::IdHash> resources_{};
    };
}
