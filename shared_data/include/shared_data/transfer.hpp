#pragma once

#include <ids/ids.hpp>
#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <string>

namespace SharedData
{
    // Put: local to remote, Get: remote to local, CrossCopy: remote to a different remote.
    BOOST_DEFINE_ENUM_CLASS(TransferKind, Put, Get, CrossCopy)

    struct TransferEndpoint
    {
        Ids::ConnectionId connectionId{};
        std::string path{};
    };
    BOOST_DESCRIBE_STRUCT(TransferEndpoint, (), (connectionId, path))

    inline TransferKind transferKindFor(TransferEndpoint const& source, TransferEndpoint const& destination)
    {
        if (Ids::isLocal(source.connectionId))
            return TransferKind::Put;
        if (Ids::isLocal(destination.connectionId))
            return TransferKind::Get;
        return TransferKind::CrossCopy;
    }

    struct TransferRequest
    {
        Ids::TransferId transferId{};
        TransferKind kind{TransferKind::Put};
        TransferEndpoint source{};
        TransferEndpoint destination{};
    };
    BOOST_DESCRIBE_STRUCT(TransferRequest, (), (transferId, kind, source, destination))
}
