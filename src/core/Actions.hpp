//
// Actions.hpp
//

#ifndef WORDCUBE_ACTIONS_HPP
#define WORDCUBE_ACTIONS_HPP

#include <expected>
#include <string>
#include <variant>
#include "Types.hpp"
#include "Match.hpp"

namespace wordcube::core
{
    // Events pushed by the match service listener.
    struct MatchEnded        { TurnBasedMatch match; };
    struct ReceivedTurnEvent { TurnBasedMatch match; bool did_become_active{false}; };
    struct WantsToQuitMatch  { TurnBasedMatch match; };

    using ListenerEvent = std::variant<MatchEnded, ReceivedTurnEvent, WantsToQuitMatch>;

    // A command that failed inside the match service client.
    struct ServiceFailure
    {
        std::string message;
    };

    struct DidFinishLaunching      {};
    // "Rematch" on the game over screen of the displayed game
    struct GameOverRematchTapped   {};
    // "Rematch" on a finished match in the active games menu
    struct ActiveGameRematchTapped { MatchId match_id; };
    // A match picked from the past games list
    struct PastGameOpened          { TurnBasedMatch match; };
    struct RematchResponse         { std::expected<TurnBasedMatch, ServiceFailure> result; };

    using AppAction = std::variant<
      DidFinishLaunching, ListenerEvent, GameOverRematchTapped,
      ActiveGameRematchTapped, PastGameOpened, RematchResponse>;
} // namespace wordcube::core

#endif //WORDCUBE_ACTIONS_HPP
