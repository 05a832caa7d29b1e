#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <unordered_set>

namespace Persistence
{
    StateHolder::StateHolder()
        : stateCache_{.connections = {}, .folders = {}, .options = OrchestrationOptions::defaults()}
    {}
    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL(StateHolder);

    std::expected<bool, std::string> StateHolder::load(nlohmann::json const& document)
    {
        try
        {
            if (document.is_null())
            {
                Log::warn("No connections document stored yet, starting with defaults.");
                stateCache_ = State{};
                dataFixer(nlohmann::json::object());
                return true;
            }

            State loaded{};
            // the first versions stored nothing but the list of connections
            if (document.is_array())
                document.get_to(loaded.connections);
            else
                document.get_to(loaded);

            stateCache_ = std::move(loaded);
            return dataFixer(document) || document.is_array();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to load connections document: {}", e.what());
            return std::unexpected(std::string{e.what()});
        }
    }

    bool StateHolder::dataFixer(nlohmann::json const& before)
    {
        bool mustSave = false;

        const auto defaults = OrchestrationOptions::defaults();
        const auto optionsBefore = nlohmann::json(stateCache_.options);
        stateCache_.options.useDefaultsFrom(defaults);
        if (optionsBefore != nlohmann::json(stateCache_.options))
        {
            Log::warn("Connections document misses some options, adding defaults.");
            mustSave = true;
        }

        std::unordered_set<Ids::ConnectionId, Ids::IdHash> seen{};
        const auto sizeBefore = stateCache_.connections.size();
        std::erase_if(stateCache_.connections, [&seen](Connection const& connection) {
            if (!seen.insert(connection.id).second)
            {
                Log::warn("Dropping duplicate connection with id: {}", connection.id.value());
                return true;
            }
            return false;
        });
        if (sizeBefore != stateCache_.connections.size())
            mustSave = true;

        for (auto& connection : stateCache_.connections)
        {
            if (connection.jumpServerId && *connection.jumpServerId == connection.id)
            {
                Log::warn("Connection '{}' uses itself as jump server, removing it.", connection.id.value());
                connection.jumpServerId = std::nullopt;
                mustSave = true;
            }
        }

        const auto hasFolder = [this](std::string const& name) {
            return std::any_of(stateCache_.folders.begin(), stateCache_.folders.end(), [&name](Folder const& f) {
                return f.name == name;
            });
        };
        for (auto const& connection : stateCache_.connections)
        {
            if (connection.folder && !hasFolder(*connection.folder))
            {
                Log::warn(
                    "Connection '{}' refers to unknown folder '{}', adding it.",
                    connection.id.value(),
                    *connection.folder);
                stateCache_.folders.push_back(Folder{.name = *connection.folder});
                mustSave = true;
            }
        }

        if (before.is_object())
        {
            const auto diff = nlohmann::json::diff(before, serialize());
            if (mustSave && !diff.empty())
                Log::warn("Connections document diff: {}", diff.dump());
        }
        return mustSave;
    }

    nlohmann::json StateHolder::serialize() const
    {
        return nlohmann::json(stateCache_);
    }

    State& StateHolder::stateCache()
    {
        return stateCache_;
    }

    State const& StateHolder::stateCache() const
    {
        return stateCache_;
    }
} // namespace Persistence
