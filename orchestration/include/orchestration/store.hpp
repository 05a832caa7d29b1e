#pragma once

#include <orchestration/options.hpp>
#include <orchestration/state.hpp>
#include <log/level.hpp>

#include <boost/signals2.hpp>

#include <functional>
#include <string>

namespace Orchestration
{
    /**
     * @brief Single writer of the orchestration state. Every change is a whole-state replacement computed by a
     * pure transition from the current state. Also carries the runtime options every component reads.
     */
    class Store
    {
      public:
        explicit Store(Options options = {});

        using ChangeSignal = boost::signals2::signal<void(State const&)>;
        using NotificationSignal = boost::signals2::signal<void(Notification const&)>;

        State const& state() const
        {
            return state_;
        }

        /**
         * @brief Computes the next state with the given function and replaces the current one.
         * Observers are notified after the replacement, so they may start further transitions.
         *
         * @param fn Callable taking a State by value and returning the next State.
         */
        template <typename FunctionT>
        void transition(FunctionT&& fn)
        {
            State next = std::forward<FunctionT>(fn)(State{state_});
            state_ = std::move(next);
            ++revision_;
            onChange_(state_);
        }

        Options const& options() const
        {
            return options_;
        }
        void setOptions(Options options);

        /// Number of transitions applied so far.
        unsigned long long revision() const
        {
            return revision_;
        }

        boost::signals2::connection onChange(std::function<void(State const&)> handler);
        boost::signals2::connection onNotification(std::function<void(Notification const&)> handler);

        /// Logs the message and hands it to the notification observers.
        void notify(Notification const& notification);
        void notify(Log::Level level, std::string message);

      private:
        Options options_;
        State state_{};
        unsigned long long revision_{0};
        ChangeSignal onChange_{};
        NotificationSignal onNotification_{};
    };
}
