//
// MatchServiceClient.hpp
//

#ifndef WORDCUBE_MATCHSERVICECLIENT_HPP
#define WORDCUBE_MATCHSERVICECLIENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Match.hpp"
#include "../core/Actions.hpp"

namespace wordcube::net
{
    struct EndMatchInTurnRequest
    {
        core::MatchId match_id;
        std::vector<std::uint8_t> match_data;
        core::PlayerId local_player_id;
        core::MatchOutcome local_player_outcome{core::MatchOutcome::Quit};
        std::string message;
    };

    // Everything the app needs from the turn based match service.
    // Every call may throw error::ServiceError; nothing here retries.
    class MatchServiceClient
    {
    public:
        virtual ~MatchServiceClient() = default;

        virtual auto Authenticate() -> void = 0;
        virtual auto LocalPlayer() const -> core::LocalPlayer = 0;

        // Blocks until an event arrives or the deadline passes (nullopt).
        virtual auto NextEvent(std::chrono::steady_clock::time_point deadline)
            -> std::optional<core::ListenerEvent> = 0;

        // Joins an open match or creates one; the match arrives as a became-active turn event.
        virtual auto FindMatch() -> void = 0;
        virtual auto Rematch(core::MatchId const& match_id) -> core::TurnBasedMatch = 0;
        virtual auto SaveCurrentTurn(core::MatchId const& match_id,
                                     std::span<std::uint8_t const> match_data) -> void = 0;
        virtual auto EndTurn(core::MatchId const& match_id,
                             std::span<std::uint8_t const> match_data,
                             std::string const& message) -> void = 0;
        virtual auto EndMatchInTurn(EndMatchInTurnRequest const& request) -> void = 0;
        // Leaves a match. Out of turn the seat quits at once; in turn a WantsToQuitMatch event follows.
        virtual auto QuitMatch(core::MatchId const& match_id) -> void = 0;

        virtual auto DismissMatchmaker() -> void = 0;
        virtual auto ShowNotificationBanner(std::string const& title,
                                            std::optional<std::string> const& message) -> void = 0;
    };
}

#endif //WORDCUBE_MATCHSERVICECLIENT_HPP
