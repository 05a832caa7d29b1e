#include <shared_data/events.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, SessionData const& event)
    {
        j = nlohmann::json{{"termId", event.sessionId}, {"data", event.data}};
    }
    void from_json(nlohmann::json const& j, SessionData& event)
    {
        j.at("termId").get_to(event.sessionId);
        j.at("data").get_to(event.data);
    }

    void to_json(nlohmann::json& j, SessionExit const& event)
    {
        j = nlohmann::json{{"termId", event.sessionId}};
        if (event.exitCode)
            j["exit_code"] = *event.exitCode;
    }
    void from_json(nlohmann::json const& j, SessionExit& event)
    {
        j.at("termId").get_to(event.sessionId);
        if (auto it = j.find("exit_code"); it != j.end() && !it->is_null())
            event.exitCode = it->get<int>();
        else
            event.exitCode = std::nullopt;
    }

    void to_json(nlohmann::json& j, TransferProgress const& event)
    {
        j = nlohmann::json{
            {"id", event.transferId},
            {"transferred", event.transferred},
            {"total", event.total},
        };
    }
    void from_json(nlohmann::json const& j, TransferProgress& event)
    {
        j.at("id").get_to(event.transferId);
        j.at("transferred").get_to(event.transferred);
        j.at("total").get_to(event.total);
    }

    void to_json(nlohmann::json& j, TransferSuccess const& event)
    {
        j = nlohmann::json{{"id", event.transferId}};
        if (event.destinationConnectionId)
            j["destination_connection_id"] = *event.destinationConnectionId;
    }
    void from_json(nlohmann::json const& j, TransferSuccess& event)
    {
        j.at("id").get_to(event.transferId);
        if (auto it = j.find("destination_connection_id"); it != j.end() && !it->is_null())
            event.destinationConnectionId = it->get<Ids::ConnectionId>();
        else
            event.destinationConnectionId = std::nullopt;
    }

    void to_json(nlohmann::json& j, TransferError const& event)
    {
        j = nlohmann::json{{"id", event.transferId}, {"error", event.error}};
    }
    void from_json(nlohmann::json const& j, TransferError& event)
    {
        j.at("id").get_to(event.transferId);
        event.error = j.value("error", std::string{"Unknown transfer error"});
    }

    void to_json(nlohmann::json& j, ConnectionStatusChange const& event)
    {
        j = nlohmann::json{{"id", event.connectionId}, {"status", event.status}};
        if (event.error)
            j["error"] = *event.error;
    }
    void from_json(nlohmann::json const& j, ConnectionStatusChange& event)
    {
        j.at("id").get_to(event.connectionId);
        j.at("status").get_to(event.status);
        if (auto it = j.find("error"); it != j.end() && !it->is_null())
            event.error = it->get<std::string>();
        else
            event.error = std::nullopt;
    }
}
