//
// Invariants.hpp
//

#ifndef WORDCUBE_INVARIANTS_HPP
#define WORDCUBE_INVARIANTS_HPP

#include <format>

#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"

namespace wordcube::debug
{
    // Throws error::AssertionError on the first broken rule.
    inline auto CheckInvariants(core::AppState const& s) -> void
    {
#if WCB_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        using namespace wordcube::core;

        auto check_over = [](GameOverState const& over, TurnBasedContext const* ctx)
        {
            // 1) A summary of a turn based game names its match
            if (over.turn_based_context)
            {
                WCB_ASSERT(over.completed_game.match_id == over.turn_based_context->match.match_id,
                           "Game over summary names another match");
            }
            if (ctx)
            {
                WCB_ASSERT(over.turn_based_context && over.turn_based_context->match.match_id == ctx->match.match_id,
                           "Nested game over belongs to another match");
            }
        };

        if (GameState const* g = AsGame(s.destination))
        {
            if (TurnBasedContext const* ctx = g->TurnContext())
            {
                // 2) The shown game carries the id of the match that produced it
                WCB_ASSERT(!ctx->match.match_id.empty(), "Turn based game without a match id");

                // 3) Every move was made from a seat in the match
                for (Move const& m : g->moves)
                {
                    WCB_ASSERT(!m.player_index || *m.player_index < ctx->match.participants.size(),
                               std::format("Move by seat {} in a match of {}", static_cast<int>(*m.player_index),
                                           ctx->match.participants.size()));
                }
            }

            // 4) A nested summary describes this very game
            if (g->game_over)
            {
                check_over(*g->game_over, g->TurnContext());
                WCB_ASSERT(g->game_over->completed_game.moves == g->moves, "Game over summary lost moves");
                WCB_ASSERT(g->game_over->completed_game.cubes == g->cubes, "Game over summary lost cubes");
            }
        }
        else if (GameOverState const* over = AsGameOver(s.destination))
        {
            check_over(*over, nullptr);
        }
#endif // WCB_ENABLE_TEST_HOOKS == true
    }
}

#endif //WORDCUBE_INVARIANTS_HPP
