//
// Game.cpp
//
#include "Game.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace wordcube::core
{
    auto GameState::FromTurnBasedMatch(Timestamp const now,
                                       LocalPlayer const& local_player,
                                       TurnBasedMatch const& match,
                                       TurnBasedMatchData const& data) -> GameState
    {
        GameState g{};
        g.cubes = data.cubes;
        g.context = TurnBasedContext{local_player, match, data.metadata};
        g.game_current_time = now;
        g.game_mode = data.game_mode;
        g.game_start_time = match.creation_date;
        g.moves = data.moves;
        g.language = data.language;
        return g;
    }

    auto GameState::TurnContext() const -> TurnBasedContext const*
    {
        return std::get_if<TurnBasedContext>(&context);
    }

    auto GameState::TurnContext() -> TurnBasedContext*
    {
        return std::get_if<TurnBasedContext>(&context);
    }

    auto GameState::IsYourTurn() const -> bool
    {
        TurnBasedContext const* ctx = TurnContext();
        if (!ctx) return true;
        return ctx->CurrentParticipantIsLocalPlayer();
    }

    auto GameState::CurrentScore() const -> int32_t
    {
        std::optional<PlyrIdxT> mine{};
        if (TurnBasedContext const* ctx = TurnContext())
        {
            mine = ctx->LocalPlayerIndex();
        }

        return std::accumulate(moves.cbegin(), moves.cend(), int32_t{0},
                               [&](int32_t acc, Move const& m)
                               {
                                   // solo moves carry no player index
                                   bool const counts = !mine || m.player_index == mine;
                                   return counts ? acc + m.score : acc;
                               });
    }

    auto MakeCompletedGame(GameState const& game) -> CompletedGame
    {
        CompletedGame c{};
        c.cubes = game.cubes;
        c.game_mode = game.game_mode;
        c.language = game.language;
        c.moves = game.moves;
        c.started_at = game.game_start_time;
        c.score = game.CurrentScore();
        if (TurnBasedContext const* ctx = game.TurnContext())
        {
            c.match_id = ctx->match.match_id;
        }
        return c;
    }

    auto MakeGameOver(GameState const& game) -> GameOverState
    {
        GameOverState over{};
        over.completed_game = MakeCompletedGame(game);
        over.is_demo = game.is_demo;
        if (TurnBasedContext const* ctx = game.TurnContext())
        {
            over.turn_based_context = *ctx;
        }
        return over;
    }
}
