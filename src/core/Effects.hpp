//
// Effects.hpp
//

#ifndef WORDCUBE_EFFECTS_HPP
#define WORDCUBE_EFFECTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Match.hpp"
#include "Game.hpp"

namespace wordcube::core
{
    // Commands the reducer asks the outside world to perform.
    struct AuthenticateLocalPlayer {};
    struct StartListening          {};
    struct DismissMatchmaker       {};
    struct SaveCurrentTurn         { MatchId match_id; std::vector<uint8_t> match_data; };
    struct EndMatchInTurn
    {
        MatchId match_id;
        std::vector<uint8_t> match_data;
        PlayerId local_player_id;
        MatchOutcome local_player_outcome{MatchOutcome::Quit};
        std::string message;
    };
    struct ShowNotificationBanner  { std::string title; std::optional<std::string> message; };
    struct RequestRematch          { MatchId match_id; };
    struct PersistGame             { GameState game; };

    using Command = std::variant<
      AuthenticateLocalPlayer, StartListening, DismissMatchmaker, SaveCurrentTurn,
      EndMatchInTurn, ShowNotificationBanner, RequestRematch, PersistGame>;

    enum class Ordering : uint8_t
    {
        Sequential,
        // siblings: all are started, all are awaited, none cancels another
        Concurrent
    };

    struct Effect
    {
        std::vector<Command> commands{};
        Ordering ordering{Ordering::Sequential};

        static auto None() -> Effect { return {}; }
        auto IsNone() const -> bool { return commands.empty(); }
    };

    inline auto CommandName(Command const& c) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, AuthenticateLocalPlayer>) return "Authenticate";
                else if constexpr (std::is_same_v<T, StartListening>) return "StartListening";
                else if constexpr (std::is_same_v<T, DismissMatchmaker>) return "DismissMatchmaker";
                else if constexpr (std::is_same_v<T, SaveCurrentTurn>) return "SaveCurrentTurn";
                else if constexpr (std::is_same_v<T, EndMatchInTurn>) return "EndMatchInTurn";
                else if constexpr (std::is_same_v<T, ShowNotificationBanner>) return "ShowNotificationBanner";
                else if constexpr (std::is_same_v<T, RequestRematch>) return "RequestRematch";
                else if constexpr (std::is_same_v<T, PersistGame>) return "PersistGame";
                else static_assert(sizeof(T) == 0, "Unnamed command");
            },
            c);
    }
} // namespace wordcube::core

#endif //WORDCUBE_EFFECTS_HPP
