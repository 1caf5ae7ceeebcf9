//
// codec.hpp
//

#ifndef WORDCUBE_CODEC_HPP
#define WORDCUBE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Match.hpp"
#include "../core/Actions.hpp"

#include "generated/flatbuffers/match_net_generated.h"

namespace wordcube::net
{
    struct ParseError
    {
        std::string message;
    };

    // ----- client -> server -----
    struct HelloMsg     { core::PlayerId player_id; std::string display_name; };
    struct FindMatchMsg { std::uint8_t min_players{2}; };
    struct SaveTurnMsg  { core::MatchId match_id; std::vector<std::uint8_t> data; };
    struct EndTurnMsg   { core::MatchId match_id; std::vector<std::uint8_t> data; std::string message; };
    struct EndMatchMsg
    {
        core::MatchId match_id;
        std::vector<std::uint8_t> data;
        core::PlayerId player_id;
        core::MatchOutcome outcome{core::MatchOutcome::Quit};
        std::string message;
    };
    struct RematchMsg   { core::MatchId match_id; };
    struct QuitMsg      { core::MatchId match_id; };

    // ----- server -> client -----
    struct HelloAckMsg   { core::LocalPlayer player; };
    struct AckMsg        { bool ok{true}; std::string error; };
    struct MatchReplyMsg { core::TurnBasedMatch match; };
    struct MatchEventMsg { core::ListenerEvent event; };

    using Body = std::variant<
      HelloMsg, FindMatchMsg, SaveTurnMsg, EndTurnMsg, EndMatchMsg, RematchMsg, QuitMsg,
      HelloAckMsg, AckMsg, MatchReplyMsg, MatchEventMsg>;

    // msg_id pairs a reply with its request; pushed events carry 0.
    struct Envelope
    {
        std::uint64_t msg_id{0};
        Body body;
    };

    auto ToFbStatus(core::MatchStatus s) noexcept -> ::wordcube::gen::net::MatchStatus;
    auto FromFbStatus(::wordcube::gen::net::MatchStatus s) noexcept -> core::MatchStatus;
    auto ToFbOutcome(core::MatchOutcome o) noexcept -> ::wordcube::gen::net::MatchOutcome;
    auto FromFbOutcome(::wordcube::gen::net::MatchOutcome o) noexcept -> core::MatchOutcome;

    auto EncodeEnvelope(Envelope const& env) -> std::vector<std::uint8_t>;

    auto DecodeEnvelope(std::span<std::byte const> bytes) -> std::expected<Envelope, ParseError>;
} // namespace wordcube::net

#endif //WORDCUBE_CODEC_HPP
