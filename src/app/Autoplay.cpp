//
// Autoplay.cpp
//
#include "Autoplay.hpp"

#include <format>
#include <print>
#include <vector>

#include "../net/TurnDataCodec.hpp"

namespace wordcube::app
{
    Autoplay::Autoplay(net::MatchServiceClient& client, AutoplayMode mode)
        : client_{client}
          , mode_{mode}
    {
    }

    auto Autoplay::Tick(core::Destination const& shown) -> bool
    {
        if (mode_ == AutoplayMode::Off) return false;

        core::GameState const* game = core::AsGame(shown);
        core::TurnBasedContext const* ctx = core::ShownTurnContext(shown);
        if (!game || !ctx || game->IsOver() || ctx->match.IsOver()) return false;

        core::TurnBasedMatch const& match = ctx->match;
        if (mode_ == AutoplayMode::Quit)
        {
            if (!acted_.emplace(match.match_id, 0).second) return false;
            std::print("[Autoplay] Quitting {}\n", match.match_id);
            client_.QuitMatch(match.match_id);
            return true;
        }

        // still waiting for an opponent, or not ours to play
        if (match.status != core::MatchStatus::Open || !ctx->CurrentParticipantIsLocalPlayer()) return false;

        std::int64_t const turn_key = core::ToMillis(match.LastTurnDate().value_or(match.creation_date));
        if (!acted_.emplace(match.match_id, turn_key).second)
        {
            return false;
        }

        std::vector<std::uint8_t> const data = net::EncodeTurnData(*ctx, *game, ctx->local_player.game_player_id);
        std::string const message = std::format("{} passed", ctx->local_player.display_name);
        std::print("[Autoplay] Ending turn in {}\n", match.match_id);
        client_.EndTurn(match.match_id, data, message);
        return true;
    }
}
