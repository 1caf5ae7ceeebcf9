//
// DailyChallenge.hpp
//

#ifndef WORDCUBE_DAILYCHALLENGE_HPP
#define WORDCUBE_DAILYCHALLENGE_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Clock.hpp"
#include "../core/Effects.hpp"
#include "../core/Game.hpp"
#include "../core/Types.hpp"
#include "UserNotifications.hpp"

namespace wordcube::app
{
    struct DailyChallenge
    {
        std::string id{};
        core::GameMode game_mode{core::GameMode::Timed};
        core::Language language{core::Language::En};
        core::Timestamp ends_at{};
    };

    struct DailyChallengeResult
    {
        int32_t out_of{0};
        std::optional<int32_t> rank{};
        std::optional<int32_t> score{};
        bool started{false};
    };

    struct TodaysDailyChallenge
    {
        DailyChallenge daily_challenge{};
        DailyChallengeResult your_result{};
    };

    struct DailyChallengeError
    {
        enum class Kind : uint8_t
        {
            AlreadyPlayed,
            CouldNotFetch,
            Other
        };

        Kind kind{Kind::Other};
        // when the next challenge opens
        core::Timestamp next_starts_at{};
        std::string detail{};
    };

    // Server side of the daily challenge.
    class DailyChallengeApi
    {
    public:
        virtual ~DailyChallengeApi() = default;

        // throws error::ServiceError
        virtual auto TodaysChallenges(core::Language language) -> std::vector<TodaysDailyChallenge> = 0;
        virtual auto Start(TodaysDailyChallenge const& challenge, core::Timestamp now)
            -> std::expected<core::GameState, DailyChallengeError> = 0;
    };

    // ----- screens presented over the daily challenge view -----
    struct DailyAlert
    {
        std::string title;
        std::string message;
    };
    struct NotificationsAuthAlert {};
    struct DailyResults {};

    using DailyDestination = std::variant<DailyAlert, NotificationsAuthAlert, DailyResults>;

    auto AlreadyPlayedAlert(core::Timestamp now, core::Timestamp next_starts_at) -> DailyAlert;
    auto CouldNotFetchDailyAlert(core::Timestamp now, core::Timestamp next_starts_at) -> DailyAlert;

    // "in 3 hours", "in 12 minutes", "now"
    auto RelativeTime(core::Timestamp now, core::Timestamp then) -> std::string;

    struct DailyChallengeState
    {
        std::vector<TodaysDailyChallenge> daily_challenges{};
        std::optional<DailyDestination> destination{};
        std::optional<core::GameMode> game_mode_is_loading{};
        std::optional<core::GameState> in_progress_unlimited{};
        std::optional<UserNotificationSettings> notification_settings{};
    };

    // ----- actions -----
    struct DailyTask {};
    struct TodaysChallengesResponse
    {
        std::expected<std::vector<TodaysDailyChallenge>, core::ServiceFailure> result;
    };
    struct GameButtonTapped { core::GameMode mode; };
    struct StartChallengeResponse
    {
        std::expected<core::GameState, DailyChallengeError> result;
    };
    struct NotificationSettingsResponse { UserNotificationSettings settings; };
    struct NotificationsAuthChosen { UserNotificationSettings settings; };
    struct PresentDestination { DailyDestination destination; };
    struct DismissDestination {};

    using DailyChallengeAction = std::variant<
      DailyTask, TodaysChallengesResponse, GameButtonTapped, StartChallengeResponse,
      NotificationSettingsResponse, NotificationsAuthChosen, PresentDestination, DismissDestination>;

    // ----- commands -----
    struct FetchNotificationSettings {};
    struct FetchTodaysChallenges { core::Language language{core::Language::En}; };
    struct StartChallenge { TodaysDailyChallenge challenge; };
    // hand the started game to whoever opens game screens
    struct StartGame { core::GameState game; };

    using DailyCommand = std::variant<FetchNotificationSettings, FetchTodaysChallenges, StartChallenge, StartGame>;

    struct DailyEffect
    {
        std::vector<DailyCommand> commands{};
        core::Ordering ordering{core::Ordering::Sequential};

        auto IsNone() const -> bool { return commands.empty(); }
    };

    class DailyChallengeReducer
    {
    public:
        explicit DailyChallengeReducer(core::GameClock const& clock);

        auto Reduce(DailyChallengeState& state, DailyChallengeAction const& action) const -> DailyEffect;

    private:
        auto OnGameButtonTapped(DailyChallengeState& state, core::GameMode mode) const -> DailyEffect;
        auto OnStartResponse(DailyChallengeState& state, StartChallengeResponse const& response) const
            -> DailyEffect;

        core::GameClock const& clock_;
    };

    struct DailyRunReport
    {
        std::vector<DailyChallengeAction> follow_ups{};
        std::vector<core::GameState> started_games{};
    };

    // Performs daily challenge commands; concurrent groups are joined before returning.
    class DailyChallengeRunner
    {
    public:
        DailyChallengeRunner(DailyChallengeApi& api, UserNotificationClient& notifications, core::GameClock const& clock);

        auto Run(DailyEffect const& effect) -> DailyRunReport;

    private:
        auto Execute(DailyCommand const& command, DailyRunReport& report) -> void;

        DailyChallengeApi& api_;
        UserNotificationClient& notifications_;
        core::GameClock const& clock_;
    };

    // ----- view -----
    struct Played { int32_t rank; int32_t out_of; };
    struct Playable {};
    struct Resume { int32_t current_score; };
    struct Unplayable {};

    using ButtonState = std::variant<Played, Playable, Resume, Unplayable>;

    auto MakeButtonState(TodaysDailyChallenge const* fetched, core::GameState const* in_progress) -> ButtonState;
    auto InactiveText(ButtonState const& s) -> std::optional<std::string>;
    auto ResumeText(ButtonState const& s) -> std::optional<std::string>;

    struct DailyChallengeViewState
    {
        std::optional<core::GameMode> game_mode_is_loading{};
        bool is_notification_status_determined{false};
        int32_t number_of_players{0};
        ButtonState timed{Playable{}};
        ButtonState unlimited{Playable{}};

        static auto From(DailyChallengeState const& state) -> DailyChallengeViewState;
    };

    auto NumberOfPlayers(std::vector<TodaysDailyChallenge> const& challenges) -> int32_t;
}

#endif //WORDCUBE_DAILYCHALLENGE_HPP
