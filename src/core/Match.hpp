//
// Match.hpp
//

#ifndef WORDCUBE_MATCH_HPP
#define WORDCUBE_MATCH_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace wordcube::core
{
    enum class MatchStatus : uint8_t
    {
        Unknown = 0,
        Open,
        Ended,
        Matching
    };

    enum class MatchOutcome : uint8_t
    {
        None = 0,
        Quit,
        Won,
        Lost,
        Tied,
        TimeExpired
    };

    struct LocalPlayer
    {
        PlayerId game_player_id{};
        std::string display_name{};
        bool is_authenticated{false};
    };
    inline auto operator==(LocalPlayer const& a, LocalPlayer const& b) -> bool
    {
        return a.game_player_id == b.game_player_id && a.display_name == b.display_name &&
               a.is_authenticated == b.is_authenticated;
    }

    struct Participant
    {
        // unset while the seat is still being matched
        std::optional<PlayerId> player_id{};
        std::string display_name{};
        MatchOutcome outcome{MatchOutcome::None};
        std::optional<Timestamp> last_turn_date{};
    };
    inline auto operator==(Participant const& a, Participant const& b) -> bool
    {
        return a.player_id == b.player_id && a.display_name == b.display_name &&
               a.outcome == b.outcome && a.last_turn_date == b.last_turn_date;
    }

    // Read-only snapshot of a match owned by the match service.
    struct TurnBasedMatch
    {
        MatchId match_id{};
        std::vector<Participant> participants{};
        std::vector<uint8_t> match_data{};
        Timestamp creation_date{};
        MatchStatus status{MatchStatus::Open};
        std::string message{};
        std::optional<PlyrIdxT> current_participant{};

        //returns nullptr if no participant holds the turn
        auto CurrentParticipant() const -> Participant const*
        {
            if (!current_participant || *current_participant >= participants.size()) return nullptr;
            return &participants[*current_participant];
        }

        auto HasAnyOutcome() const -> bool
        {
            return std::ranges::any_of(participants,
                                       [](Participant const& p) { return p.outcome != MatchOutcome::None; });
        }

        auto IsOver() const -> bool { return status == MatchStatus::Ended || HasAnyOutcome(); }

        auto LastTurnDate() const -> std::optional<Timestamp>
        {
            std::optional<Timestamp> latest{};
            for (Participant const& p : participants)
            {
                if (p.last_turn_date && (!latest || *p.last_turn_date > *latest)) latest = p.last_turn_date;
            }
            return latest;
        }

        auto IndexOf(PlayerId const& id) const -> std::optional<PlyrIdxT>
        {
            for (size_t i{}; i < participants.size(); ++i)
            {
                if (participants[i].player_id == id) return static_cast<PlyrIdxT>(i);
            }
            return std::nullopt;
        }
    };
    inline auto operator==(TurnBasedMatch const& a, TurnBasedMatch const& b) -> bool
    {
        return a.match_id == b.match_id && a.participants == b.participants && a.match_data == b.match_data &&
               a.creation_date == b.creation_date && a.status == b.status && a.message == b.message &&
               a.current_participant == b.current_participant;
    }
}

#endif //WORDCUBE_MATCH_HPP
