#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(ConnectionId)
DEFINE_ID_TYPE(TabId)
DEFINE_ID_TYPE(SessionId)
DEFINE_ID_TYPE(TransferId)
DEFINE_ID_TYPE(TunnelId)

namespace Ids
{
    /// The pseudo-connection that stands for the local machine. It is never stored in the registry.
    inline ConnectionId localConnectionId()
    {
        return makeConnectionId("local");
    }

    inline bool isLocal(ConnectionId const& id)
    {
        return id == localConnectionId();
    }

    /// Terminal session ids carry a "term-" prefix so the backend can tell them apart from connection ids.
    inline SessionId generateTerminalSessionId()
    {
        return makeSessionId("term-" + generateUuid());
    }
}
