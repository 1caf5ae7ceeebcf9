//
// State.hpp
//

#ifndef WORDCUBE_STATE_HPP
#define WORDCUBE_STATE_HPP

#include <optional>
#include <variant>
#include "Types.hpp"
#include "Game.hpp"

namespace wordcube::core
{
    struct NoDestination {};

    // The one screen currently shown. Replaced wholesale by the reducer.
    using Destination = std::variant<NoDestination, GameState, GameOverState>;

    //accessors return nullptr when another screen is shown
    inline auto AsGame(Destination const& d) -> GameState const* { return std::get_if<GameState>(&d); }
    inline auto AsGame(Destination& d) -> GameState* { return std::get_if<GameState>(&d); }
    inline auto AsGameOver(Destination const& d) -> GameOverState const* { return std::get_if<GameOverState>(&d); }

    //returns nullptr unless a turn based game is shown
    inline auto ShownTurnContext(Destination const& d) -> TurnBasedContext const*
    {
        GameState const* g = AsGame(d);
        return g ? g->TurnContext() : nullptr;
    }

    enum class ScreenPhase : uint8_t
    {
        Idle,
        Viewing,
        Finished
    };

    struct ScreenSummary
    {
        ScreenPhase phase{ScreenPhase::Idle};
        std::optional<MatchId> match_id{};
    };

    // Collapses a destination into Idle / Viewing(match) / Finished(match).
    inline auto Summarize(Destination const& d) -> ScreenSummary
    {
        if (GameState const* g = AsGame(d))
        {
            ScreenSummary s{g->IsOver() ? ScreenPhase::Finished : ScreenPhase::Viewing, std::nullopt};
            if (TurnBasedContext const* ctx = g->TurnContext()) s.match_id = ctx->match.match_id;
            return s;
        }
        if (GameOverState const* over = AsGameOver(d))
        {
            ScreenSummary s{ScreenPhase::Finished, over->completed_game.match_id};
            return s;
        }
        return {};
    }

    struct AppState
    {
        Destination destination{NoDestination{}};
    };
} // namespace wordcube::core

#endif //WORDCUBE_STATE_HPP
