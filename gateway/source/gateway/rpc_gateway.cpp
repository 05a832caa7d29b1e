#include <gateway/rpc_gateway.hpp>
#include <log/log.hpp>
#include <shared_data/error_or_success.hpp>

#include <boost/asio/post.hpp>

#include <atomic>
#include <type_traits>

namespace Gateway
{
    namespace
    {
        template <typename T, typename DecodeT>
        std::expected<T, Error> decodeReply(Command command, nlohmann::json const& reply, DecodeT const& decode)
        {
            try
            {
                const auto envelope = reply.get<SharedData::ErrorOrSuccess<>>();
                if (!envelope)
                    return std::unexpected(Error{.command = command, .message = *envelope.error});

                if constexpr (std::is_void_v<T>)
                    return {};
                else
                    return decode(reply);
            }
            catch (std::exception const& e)
            {
                Log::error("Malformed reply on '{}': {}", channelName(command), e.what());
                return std::unexpected(Error{.command = command, .message = std::string{"Malformed reply: "} + e.what()});
            }
        }

        struct NoDecode
        {
            void operator()(nlohmann::json const&) const
            {}
        };
    }

    struct RpcGateway::Implementation : public std::enable_shared_from_this<RpcGateway::Implementation>
    {
        boost::asio::any_io_executor executor;
        Transport* transport;
        EventHub events;

        Implementation(boost::asio::any_io_executor executor, Transport& transport)
            : executor{std::move(executor)}
            , transport{&transport}
            , events{}
        {}

        template <typename T, typename DecodeT = NoDecode>
        void call(Command command, nlohmann::json const& payload, Handler<T> onComplete, DecodeT decode = {})
        {
            Log::trace("Invoking '{}'.", channelName(command));
            transport->invoke(
                std::string{channelName(command)},
                payload,
                [executor = executor,
                 command,
                 replied = std::make_shared<std::atomic_bool>(false),
                 onComplete = std::move(onComplete),
                 decode = std::move(decode)](nlohmann::json const& reply) {
                    if (replied->exchange(true))
                    {
                        Log::warn("Ignoring repeated reply on '{}'.", channelName(command));
                        return;
                    }
                    boost::asio::post(executor, [command, reply, onComplete, decode]() {
                        auto result = decodeReply<T>(command, reply, decode);
                        if (onComplete)
                            onComplete(result);
                    });
                });
        }

        void listen()
        {
            transport->setEventCallback([weak = weak_from_this(), executor = executor](
                                            std::string const& channel, nlohmann::json const& payload) {
                boost::asio::post(executor, [weak, channel, payload]() {
                    if (auto impl = weak.lock(); impl)
                        impl->events.dispatch(channel, payload);
                });
            });
        }
    };

    RpcGateway::RpcGateway(boost::asio::any_io_executor executor, Transport& transport)
        : impl_{std::make_shared<Implementation>(std::move(executor), transport)}
    {
        impl_->listen();
    }
    RpcGateway::~RpcGateway()
    {
        if (impl_)
            impl_->transport->setEventCallback({});
    }
    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL_NO_DTOR(RpcGateway);

    void RpcGateway::connect(SharedData::ConnectionConfig const& config, Handler<ConnectResult> onComplete)
    {
        impl_->call<ConnectResult>(
            Command::Connect, nlohmann::json{{"config", config}}, std::move(onComplete), [](nlohmann::json const& reply) {
                ConnectResult result{};
                if (reply.is_object())
                {
                    if (auto it = reply.find("detected_os"); it != reply.end() && it->is_string())
                        result.detectedOs = it->get<std::string>();
                }
                return result;
            });
    }

    void RpcGateway::disconnect(Ids::ConnectionId const& connectionId, Handler<void> onComplete)
    {
        impl_->call<void>(Command::Disconnect, nlohmann::json{{"id", connectionId}}, std::move(onComplete));
    }

    void RpcGateway::homePath(Ids::ConnectionId const& connectionId, Handler<std::string> onComplete)
    {
        impl_->call<std::string>(
            Command::HomePath, nlohmann::json{{"id", connectionId}}, std::move(onComplete), [](nlohmann::json const& reply) {
                if (reply.is_object())
                    return reply.at("path").get<std::string>();
                return reply.get<std::string>();
            });
    }

    void RpcGateway::spawnSession(SpawnRequest const& request, Handler<void> onComplete)
    {
        impl_->call<void>(
            Command::SpawnSession,
            nlohmann::json{
                {"termId", request.sessionId},
                {"connectionId", request.connectionId},
                {"rows", request.rows},
                {"cols", request.cols},
            },
            std::move(onComplete));
    }

    void RpcGateway::write(Ids::SessionId const& sessionId, std::string const& data, Handler<void> onComplete)
    {
        impl_->call<void>(Command::Write, nlohmann::json{{"termId", sessionId}, {"data", data}}, std::move(onComplete));
    }

    void RpcGateway::resize(Ids::SessionId const& sessionId, int rows, int cols, Handler<void> onComplete)
    {
        impl_->call<void>(
            Command::Resize,
            nlohmann::json{{"termId", sessionId}, {"rows", rows}, {"cols", cols}},
            std::move(onComplete));
    }

    void RpcGateway::closeSession(Ids::SessionId const& sessionId, Handler<void> onComplete)
    {
        impl_->call<void>(Command::CloseSession, nlohmann::json{{"termId", sessionId}}, std::move(onComplete));
    }

    void RpcGateway::startTransfer(SharedData::TransferRequest const& request, Handler<void> onComplete)
    {
        nlohmann::json payload{};
        switch (request.kind)
        {
            case SharedData::TransferKind::Put:
                payload = {
                    {"id", request.destination.connectionId},
                    {"localPath", request.source.path},
                    {"remotePath", request.destination.path},
                    {"transferId", request.transferId},
                };
                break;
            case SharedData::TransferKind::Get:
                payload = {
                    {"id", request.source.connectionId},
                    {"remotePath", request.source.path},
                    {"localPath", request.destination.path},
                    {"transferId", request.transferId},
                };
                break;
            case SharedData::TransferKind::CrossCopy:
                payload = {
                    {"sourceConnectionId", request.source.connectionId},
                    {"sourcePath", request.source.path},
                    {"destinationConnectionId", request.destination.connectionId},
                    {"destinationPath", request.destination.path},
                    {"transferId", request.transferId},
                };
                break;
        }
        impl_->call<void>(transferCommand(request.kind), payload, std::move(onComplete));
    }

    void RpcGateway::cancelTransfer(Ids::TransferId const& transferId, Handler<void> onComplete)
    {
        impl_->call<void>(Command::CancelTransfer, nlohmann::json{{"transferId", transferId}}, std::move(onComplete));
    }

    void RpcGateway::listDirectory(
        Ids::ConnectionId const& connectionId,
        std::string const& path,
        Handler<std::vector<SharedData::DirectoryEntry>> onComplete)
    {
        impl_->call<std::vector<SharedData::DirectoryEntry>>(
            Command::ListDirectory,
            nlohmann::json{{"id", connectionId}, {"path", path}},
            std::move(onComplete),
            [](nlohmann::json const& reply) {
                if (reply.is_object())
                    return reply.at("entries").get<std::vector<SharedData::DirectoryEntry>>();
                return reply.get<std::vector<SharedData::DirectoryEntry>>();
            });
    }

    void RpcGateway::rename(
        Ids::ConnectionId const& connectionId,
        std::string const& from,
        std::string const& to,
        Handler<void> onComplete)
    {
        impl_->call<void>(
            Command::Rename,
            nlohmann::json{{"id", connectionId}, {"oldPath", from}, {"newPath", to}},
            std::move(onComplete));
    }

    void RpcGateway::saveConnections(nlohmann::json const& document, Handler<void> onComplete)
    {
        impl_->call<void>(Command::SaveConnections, document, std::move(onComplete));
    }

    void RpcGateway::loadConnections(Handler<nlohmann::json> onComplete)
    {
        impl_->call<nlohmann::json>(
            Command::LoadConnections, nlohmann::json::object(), std::move(onComplete), [](nlohmann::json const& reply) {
                return reply;
            });
    }

    void RpcGateway::listTunnels(
        Ids::ConnectionId const& connectionId,
        Handler<std::vector<SharedData::TunnelConfig>> onComplete)
    {
        impl_->call<std::vector<SharedData::TunnelConfig>>(
            Command::ListTunnels,
            nlohmann::json{{"connectionId", connectionId}},
            std::move(onComplete),
            [](nlohmann::json const& reply) {
                return reply.get<std::vector<SharedData::TunnelConfig>>();
            });
    }

    void RpcGateway::startTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete)
    {
        impl_->call<void>(
            Command::StartTunnel, nlohmann::json{{"id", tunnelId}, {"connectionId", connectionId}}, std::move(onComplete));
    }

    void RpcGateway::stopTunnel(Ids::TunnelId const& tunnelId, Ids::ConnectionId const& connectionId, Handler<void> onComplete)
    {
        impl_->call<void>(
            Command::StopTunnel, nlohmann::json{{"id", tunnelId}, {"connectionId", connectionId}}, std::move(onComplete));
    }

    EventHub& RpcGateway::events()
    {
        return impl_->events;
    }
}
