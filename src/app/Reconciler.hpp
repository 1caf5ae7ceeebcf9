//
// Reconciler.hpp
//

#ifndef WORDCUBE_RECONCILER_HPP
#define WORDCUBE_RECONCILER_HPP

#include <chrono>
#include <functional>
#include <optional>

#include "../core/Types.hpp"
#include "../core/Match.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Effects.hpp"
#include "../core/Exception.hpp"
#include "../core/Clock.hpp"
#include "../core/Cubes.hpp"

namespace wordcube::app
{
    // Everything the reducer reads besides its state and action.
    struct ReconcilerEnv
    {
        core::GameClock const& clock;
        core::CubeGenerator& cubes;
        // read on every action; authentication may change it
        std::function<core::LocalPlayer()> local_player;
        std::function<std::optional<core::PlayerId>()> current_player_id;
        // called for malformed match data only
        std::function<void(core::MatchId const&, core::error::TurnDataError const&)> report_decode_error;
        std::chrono::seconds recent_turn_window{core::constants::RecentTurnWindow};
    };

    // Turns (destination, action) into (destination, commands). Touches nothing but `state`.
    class TurnReconciler
    {
    public:
        explicit TurnReconciler(ReconcilerEnv env);

        auto Reduce(core::AppState& state, core::AppAction const& action) -> core::Effect;

    private:
        auto OnListenerEvent(core::AppState& state, core::ListenerEvent const& event) -> core::Effect;
        auto OnMatchEnded(core::AppState& state, core::TurnBasedMatch const& match) -> core::Effect;
        auto OnWantsToQuit(core::TurnBasedMatch const& match) const -> core::Effect;
        auto OnRematchTapped(core::AppState& state) -> core::Effect;
        auto OnRematchResponse(core::AppState& state, core::RematchResponse const& response) -> core::Effect;

        auto HandleMatch(core::AppState& state, core::TurnBasedMatch const& match, bool did_become_active)
            -> core::Effect;
        auto StartFreshMatch(core::AppState& state, core::TurnBasedMatch const& match) -> core::Effect;
        auto ShowMatch(core::AppState& state,
                       core::TurnBasedMatch const& match,
                       core::TurnBasedMatchData const& data) -> core::Effect;
        auto NotifyIfRecent(core::AppState const& state,
                            core::TurnBasedMatch const& match,
                            core::TurnBasedMatchData const& data) const -> core::Effect;

        auto Decode(core::TurnBasedMatch const& match) const -> std::optional<core::TurnBasedMatchData>;

        ReconcilerEnv env_;
    };
}

#endif //WORDCUBE_RECONCILER_HPP
