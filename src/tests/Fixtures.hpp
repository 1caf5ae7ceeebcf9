//
// Fixtures.hpp
//

#ifndef WORDCUBE_TEST_FIXTURES_HPP
#define WORDCUBE_TEST_FIXTURES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Match.hpp"
#include "../core/Game.hpp"
#include "../net/TurnDataCodec.hpp"

namespace wordcube::test
{
    using namespace wordcube::core;

    inline auto T0() -> Timestamp
    {
        return FromMillis(1'700'000'000'000);
    }

    inline auto Board() -> Puzzle
    {
        Puzzle p{};
        for (size_t i{}; i < p.size(); ++i)
        {
            p[i].left.letter = static_cast<char>('A' + i % 26);
            p[i].right.letter = static_cast<char>('A' + (i + 7) % 26);
            p[i].top.letter = static_cast<char>('A' + (i + 13) % 26);
        }
        return p;
    }

    inline auto Me() -> LocalPlayer
    {
        return LocalPlayer{"p-me", "Blob", true};
    }

    inline auto Them() -> LocalPlayer
    {
        return LocalPlayer{"p-them", "Blobby", true};
    }

    // Two seats, me first. `current` picks who holds the turn.
    inline auto MakeMatch(MatchId id,
                          std::optional<PlyrIdxT> current = 0,
                          std::vector<uint8_t> data = {}) -> TurnBasedMatch
    {
        TurnBasedMatch m{};
        m.match_id = std::move(id);
        m.participants = {
            Participant{Me().game_player_id, Me().display_name, MatchOutcome::None, std::nullopt},
            Participant{Them().game_player_id, Them().display_name, MatchOutcome::None, std::nullopt},
        };
        m.match_data = std::move(data);
        m.creation_date = T0() - std::chrono::hours(1);
        m.status = MatchStatus::Open;
        m.message = "Your turn against Blobby";
        m.current_participant = current;
        return m;
    }

    inline auto SampleMoves() -> std::vector<Move>
    {
        return {
            Move{T0() - std::chrono::minutes(5), PlyrIdxT{0}, 12,
                 PlayedWord{{{0, CubeFaceSide::Top}, {1, CubeFaceSide::Left}, {2, CubeFaceSide::Right}}}},
            Move{T0() - std::chrono::minutes(3), PlyrIdxT{1}, 0, RemovedCube{26}},
            Move{T0() - std::chrono::minutes(1), PlyrIdxT{1}, 20,
                 PlayedWord{{{3, CubeFaceSide::Top}, {4, CubeFaceSide::Top}, {5, CubeFaceSide::Left}}}},
        };
    }

    inline auto SampleData() -> TurnBasedMatchData
    {
        TurnBasedMatchData d{};
        d.metadata.last_opened_at = T0() - std::chrono::minutes(10);
        d.metadata.player_index_to_id = {{0, Me().game_player_id}, {1, Them().game_player_id}};
        d.cubes = Board();
        d.moves = SampleMoves();
        d.game_mode = GameMode::Unlimited;
        d.language = Language::En;
        d.player_id = Them().game_player_id;
        return d;
    }

    inline auto SampleBytes() -> std::vector<uint8_t>
    {
        return net::EncodeTurnData(SampleData());
    }

    // Polls `done` until it holds or two seconds pass.
    inline auto Eventually(std::function<bool()> const& done) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (done()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return done();
    }
}

#endif //WORDCUBE_TEST_FIXTURES_HPP
