#pragma once

#include <roar/detail/pimpl_special_functions.hpp>

#include <persistence/state/state.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace Persistence
{
    /**
     * @brief Owns the cached connections document. The document itself is stored by the backend, this class
     * only converts it and repairs what is missing or inconsistent.
     */
    class StateHolder
    {
      public:
        StateHolder();
        ROAR_PIMPL_SPECIAL_FUNCTIONS(StateHolder);

        /**
         * @brief Replaces the cache with the given document.
         *
         * @return true if the document had to be fixed and should be written back, an error if it could not
         * be parsed. The cache is left untouched on error.
         */
        std::expected<bool, std::string> load(nlohmann::json const& document);

        nlohmann::json serialize() const;

        State& stateCache();
        State const& stateCache() const;

      private:
        bool dataFixer(nlohmann::json const& before);

      private:
        State stateCache_;
    };
} // namespace Persistence
