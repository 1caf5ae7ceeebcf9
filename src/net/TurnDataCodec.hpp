//
// TurnDataCodec.hpp
//

#ifndef WORDCUBE_TURNDATACODEC_HPP
#define WORDCUBE_TURNDATACODEC_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"
#include "../core/Exception.hpp"

namespace wordcube::net
{
    using DecodeResult = std::expected<core::TurnBasedMatchData, core::error::TurnDataError>;

    // Payload for a turn played in `context`. When `player_id` is set and the local
    // player has a seat in the match, the seat is recorded in the index map.
    auto MakeTurnData(core::TurnBasedContext const& context,
                      core::GameState const& game,
                      std::optional<core::PlayerId> const& player_id) -> core::TurnBasedMatchData;

    // Same logical input, same bytes.
    auto EncodeTurnData(core::TurnBasedMatchData const& data) -> std::vector<std::uint8_t>;

    auto EncodeTurnData(core::TurnBasedContext const& context,
                        core::GameState const& game,
                        std::optional<core::PlayerId> const& player_id) -> std::vector<std::uint8_t>;

    // Empty input -> NoTurnDataYet. Anything unreadable -> MalformedTurnData. Never throws.
    auto DecodeTurnData(std::span<std::byte const> bytes) -> DecodeResult;
    auto DecodeTurnData(std::vector<std::uint8_t> const& bytes) -> DecodeResult;
} // namespace wordcube::net

#endif //WORDCUBE_TURNDATACODEC_HPP
