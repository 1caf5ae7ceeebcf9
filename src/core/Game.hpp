//
// Game.hpp
//

#ifndef WORDCUBE_GAME_HPP
#define WORDCUBE_GAME_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Match.hpp"

namespace wordcube::core
{
    // Bookkeeping layered on top of a match snapshot and saved with every turn.
    struct TurnBasedMetadata
    {
        Timestamp last_opened_at{};
        std::map<PlyrIdxT, PlayerId> player_index_to_id{};
    };
    inline auto operator==(TurnBasedMetadata const& a, TurnBasedMetadata const& b) -> bool
    {
        return a.last_opened_at == b.last_opened_at && a.player_index_to_id == b.player_index_to_id;
    }

    struct TurnBasedContext
    {
        LocalPlayer local_player{};
        TurnBasedMatch match{};
        TurnBasedMetadata metadata{};

        auto LocalPlayerIndex() const -> std::optional<PlyrIdxT>
        {
            return match.IndexOf(local_player.game_player_id);
        }

        auto CurrentParticipantIsLocalPlayer() const -> bool
        {
            Participant const* current = match.CurrentParticipant();
            return current != nullptr && current->player_id == local_player.game_player_id;
        }
    };
    inline auto operator==(TurnBasedContext const& a, TurnBasedContext const& b) -> bool
    {
        return a.local_player == b.local_player && a.match == b.match && a.metadata == b.metadata;
    }

    // Decoded form of a match's data blob.
    struct TurnBasedMatchData
    {
        TurnBasedMetadata metadata{};
        Puzzle cubes{};
        std::vector<Move> moves{};
        GameMode game_mode{GameMode::Unlimited};
        Language language{Language::En};
        // api player that produced this turn, when known
        std::optional<PlayerId> player_id{};
    };
    inline auto operator==(TurnBasedMatchData const& a, TurnBasedMatchData const& b) -> bool
    {
        return a.metadata == b.metadata && a.cubes == b.cubes && a.moves == b.moves &&
               a.game_mode == b.game_mode && a.language == b.language && a.player_id == b.player_id;
    }

    struct SoloContext {};
    struct DailyChallengeContext
    {
        std::string challenge_id{};
    };

    using GameContext = std::variant<SoloContext, DailyChallengeContext, TurnBasedContext>;

    struct ActiveGames
    {
        std::vector<MatchId> turn_based_matches{};
        std::optional<int32_t> solo_unlimited_score{};
        std::optional<int32_t> daily_unlimited_score{};
    };
    inline auto operator==(ActiveGames const& a, ActiveGames const& b) -> bool
    {
        return a.turn_based_matches == b.turn_based_matches && a.solo_unlimited_score == b.solo_unlimited_score &&
               a.daily_unlimited_score == b.daily_unlimited_score;
    }

    struct CompletedGame
    {
        Puzzle cubes{};
        GameMode game_mode{GameMode::Unlimited};
        Language language{Language::En};
        std::vector<Move> moves{};
        Timestamp started_at{};
        int32_t score{0};
        std::optional<MatchId> match_id{};
    };

    struct GameOverState
    {
        CompletedGame completed_game{};
        bool is_demo{false};
        std::optional<TurnBasedContext> turn_based_context{};
    };

    class GameState
    {
    public:
        Puzzle cubes{};
        GameContext context{SoloContext{}};
        Timestamp game_current_time{};
        GameMode game_mode{GameMode::Unlimited};
        Timestamp game_start_time{};
        std::vector<Move> moves{};
        Language language{Language::En};
        bool is_demo{false};
        bool is_game_loaded{false};
        ActiveGames active_games{};
        // set once the game is finished; the game screen then shows the summary
        std::optional<GameOverState> game_over{};

        // Rebuilds a game from a match snapshot and its decoded data blob.
        static auto FromTurnBasedMatch(Timestamp now,
                                       LocalPlayer const& local_player,
                                       TurnBasedMatch const& match,
                                       TurnBasedMatchData const& data) -> GameState;

        //returns nullptr for solo and daily games
        auto TurnContext() const -> TurnBasedContext const*;
        auto TurnContext() -> TurnBasedContext*;

        // Solo games are always "your turn".
        auto IsYourTurn() const -> bool;
        auto IsOver() const -> bool { return game_over.has_value(); }
        auto CurrentScore() const -> int32_t;
    };

    auto MakeCompletedGame(GameState const& game) -> CompletedGame;

    // Summary nested into a finished game.
    auto MakeGameOver(GameState const& game) -> GameOverState;
}

#endif //WORDCUBE_GAME_HPP
