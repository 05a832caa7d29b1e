#pragma once

#include <ids/ids.hpp>
#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <cstdint>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(TunnelType, Local, Remote)

    struct TunnelConfig
    {
        Ids::TunnelId id{};
        Ids::ConnectionId connectionId{};
        std::string name{};
        TunnelType type{TunnelType::Local};
        std::uint16_t localPort{0};
        std::string remoteHost{};
        std::uint16_t remotePort{0};
        bool bindToAny{false};
        bool autoStart{false};
    };
    BOOST_DESCRIBE_STRUCT(
        TunnelConfig,
        (),
        (id, connectionId, name, type, localPort, remoteHost, remotePort, bindToAny, autoStart))
}
