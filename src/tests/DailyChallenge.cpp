#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Clock.hpp"
#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../app/DailyChallenge.hpp"
#include "../app/UserNotifications.hpp"

#include "Fixtures.hpp"

using namespace wordcube::core;
using namespace wordcube::app;
using namespace wordcube::test;

namespace
{
    auto Challenge(GameMode mode, bool started, std::optional<int32_t> rank = std::nullopt) -> TodaysDailyChallenge
    {
        TodaysDailyChallenge c{};
        c.daily_challenge.id = mode == GameMode::Timed ? "daily-timed" : "daily-unlimited";
        c.daily_challenge.game_mode = mode;
        c.daily_challenge.ends_at = T0() + std::chrono::hours(3);
        c.your_result.out_of = 40;
        c.your_result.rank = rank;
        c.your_result.started = started;
        return c;
    }

    auto DailyGame(std::string id, int32_t score) -> GameState
    {
        GameState g{};
        g.cubes = Board();
        g.context = DailyChallengeContext{std::move(id)};
        g.game_start_time = T0();
        g.moves = {Move{T0(), std::nullopt, score, PlayedWord{}}};
        return g;
    }

    class FakeDailyApi final : public DailyChallengeApi
    {
    public:
        auto TodaysChallenges(Language) -> std::vector<TodaysDailyChallenge> override
        {
            ++fetches;
            if (fail_fetch) WCB_THROW(error::Code::Service, "offline");
            std::this_thread::sleep_for(delay);
            return {Challenge(GameMode::Timed, false), Challenge(GameMode::Unlimited, false)};
        }

        auto Start(TodaysDailyChallenge const& challenge, Timestamp) -> std::expected<GameState, DailyChallengeError>
            override
        {
            if (fail_start) WCB_THROW(error::Code::Service, "timeout");
            if (challenge.your_result.started && !allow_resume)
            {
                return std::unexpected(DailyChallengeError{DailyChallengeError::Kind::AlreadyPlayed,
                                                           challenge.daily_challenge.ends_at, "started"});
            }
            return DailyGame(challenge.daily_challenge.id, 0);
        }

        std::atomic<int> fetches{0};
        bool fail_fetch{false};
        bool fail_start{false};
        bool allow_resume{false};
        std::chrono::milliseconds delay{0};
    };

    struct Rig
    {
        FixedGameClock clock{T0()};
        DailyChallengeReducer reducer{clock};
        DailyChallengeState state{};
    };

    auto AlertOf(DailyChallengeState const& s) -> std::optional<DailyAlert>
    {
        if (!s.destination) return std::nullopt;
        if (DailyAlert const* a = std::get_if<DailyAlert>(&*s.destination)) return *a;
        return std::nullopt;
    }
}

TEST(DailyChallenge_Task, FetchesSettingsAndChallengesTogether)
{
    Rig rig;
    DailyEffect const fx = rig.reducer.Reduce(rig.state, DailyTask{});

    EXPECT_EQ(fx.ordering, Ordering::Concurrent);
    ASSERT_EQ(fx.commands.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<FetchNotificationSettings>(fx.commands[0]));
    ASSERT_TRUE(std::holds_alternative<FetchTodaysChallenges>(fx.commands[1]));
    EXPECT_EQ(std::get<FetchTodaysChallenges>(fx.commands[1]).language, Language::En);
}

TEST(DailyChallenge_Fetch, ResponseReplacesChallenges)
{
    Rig rig;
    std::vector<TodaysDailyChallenge> const fetched{Challenge(GameMode::Timed, true, 3)};
    EXPECT_TRUE(rig.reducer.Reduce(rig.state, TodaysChallengesResponse{fetched}).IsNone());
    ASSERT_EQ(rig.state.daily_challenges.size(), 1u);
    EXPECT_EQ(rig.state.daily_challenges[0].your_result.rank, 3);
}

TEST(DailyChallenge_Fetch, FailureLeavesStateAlone)
{
    Rig rig;
    rig.state.daily_challenges = {Challenge(GameMode::Timed, false)};
    DailyEffect const fx =
        rig.reducer.Reduce(rig.state, TodaysChallengesResponse{std::unexpected(ServiceFailure{"offline"})});
    EXPECT_TRUE(fx.IsNone());
    EXPECT_EQ(rig.state.daily_challenges.size(), 1u);
    EXPECT_FALSE(rig.state.destination.has_value());
}

TEST(DailyChallenge_Tap, UnstartedTimedStartsLoading)
{
    Rig rig;
    rig.state.daily_challenges = {Challenge(GameMode::Timed, false), Challenge(GameMode::Unlimited, true)};

    DailyEffect const fx = rig.reducer.Reduce(rig.state, GameButtonTapped{GameMode::Timed});
    EXPECT_EQ(rig.state.game_mode_is_loading, GameMode::Timed);
    ASSERT_EQ(fx.commands.size(), 1u);
    StartChallenge const* start = std::get_if<StartChallenge>(&fx.commands[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->challenge.daily_challenge.id, "daily-timed");
}

TEST(DailyChallenge_Tap, StartedTimedShowsAlreadyPlayed)
{
    Rig rig;
    rig.state.daily_challenges = {Challenge(GameMode::Timed, true)};

    EXPECT_TRUE(rig.reducer.Reduce(rig.state, GameButtonTapped{GameMode::Timed}).IsNone());
    EXPECT_FALSE(rig.state.game_mode_is_loading.has_value());
    std::optional<DailyAlert> const alert = AlertOf(rig.state);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->title, "Already played");
    EXPECT_EQ(alert->message,
              "You already played today's daily challenge. You can play the next one in 3 hours.");
}

TEST(DailyChallenge_Tap, StartedUnlimitedResumesWhenInProgress)
{
    Rig rig;
    rig.state.daily_challenges = {Challenge(GameMode::Unlimited, true)};

    EXPECT_TRUE(rig.reducer.Reduce(rig.state, GameButtonTapped{GameMode::Unlimited}).IsNone());
    ASSERT_TRUE(AlertOf(rig.state).has_value());

    rig.state.destination.reset();
    rig.state.in_progress_unlimited = DailyGame("daily-unlimited", 15);
    DailyEffect const fx = rig.reducer.Reduce(rig.state, GameButtonTapped{GameMode::Unlimited});
    EXPECT_EQ(fx.commands.size(), 1u);
    EXPECT_EQ(rig.state.game_mode_is_loading, GameMode::Unlimited);
    EXPECT_FALSE(rig.state.destination.has_value());
}

TEST(DailyChallenge_Tap, UnknownModeIsIgnored)
{
    Rig rig;
    rig.state.daily_challenges = {Challenge(GameMode::Timed, false)};
    EXPECT_TRUE(rig.reducer.Reduce(rig.state, GameButtonTapped{GameMode::Unlimited}).IsNone());
    EXPECT_FALSE(rig.state.game_mode_is_loading.has_value());
}

TEST(DailyChallenge_Start, SuccessStartsTheGame)
{
    Rig rig;
    rig.state.game_mode_is_loading = GameMode::Timed;

    DailyEffect const fx = rig.reducer.Reduce(rig.state, StartChallengeResponse{DailyGame("daily-timed", 0)});
    EXPECT_FALSE(rig.state.game_mode_is_loading.has_value());
    ASSERT_EQ(fx.commands.size(), 1u);
    StartGame const* start = std::get_if<StartGame>(&fx.commands[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(std::get<DailyChallengeContext>(start->game.context).challenge_id, "daily-timed");
}

TEST(DailyChallenge_Start, AlreadyPlayedShowsAlert)
{
    Rig rig;
    rig.state.game_mode_is_loading = GameMode::Timed;
    DailyChallengeError const err{DailyChallengeError::Kind::AlreadyPlayed, T0() + std::chrono::minutes(1), ""};

    EXPECT_TRUE(rig.reducer.Reduce(rig.state, StartChallengeResponse{std::unexpected(err)}).IsNone());
    EXPECT_FALSE(rig.state.game_mode_is_loading.has_value());
    std::optional<DailyAlert> const alert = AlertOf(rig.state);
    ASSERT_TRUE(alert.has_value());
    EXPECT_NE(alert->message.find("in 1 minute."), std::string::npos);
}

TEST(DailyChallenge_Start, CouldNotFetchShowsAlert)
{
    Rig rig;
    rig.state.game_mode_is_loading = GameMode::Unlimited;
    DailyChallengeError const err{DailyChallengeError::Kind::CouldNotFetch, T0() + std::chrono::hours(50), ""};

    rig.reducer.Reduce(rig.state, StartChallengeResponse{std::unexpected(err)});
    EXPECT_FALSE(rig.state.game_mode_is_loading.has_value());
    std::optional<DailyAlert> const alert = AlertOf(rig.state);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->title, "Couldn't start today's daily");
    EXPECT_NE(alert->message.find("You can play the next daily in 2 days."), std::string::npos);
}

TEST(DailyChallenge_Start, OtherErrorKeepsLoading)
{
    Rig rig;
    rig.state.game_mode_is_loading = GameMode::Timed;
    DailyChallengeError const err{DailyChallengeError::Kind::Other, T0(), "boom"};

    EXPECT_TRUE(rig.reducer.Reduce(rig.state, StartChallengeResponse{std::unexpected(err)}).IsNone());
    EXPECT_EQ(rig.state.game_mode_is_loading, GameMode::Timed);
    EXPECT_FALSE(rig.state.destination.has_value());
}

TEST(DailyChallenge_Destination, PresentAndDismiss)
{
    Rig rig;
    rig.reducer.Reduce(rig.state, PresentDestination{DailyResults{}});
    ASSERT_TRUE(rig.state.destination.has_value());
    EXPECT_TRUE(std::holds_alternative<DailyResults>(*rig.state.destination));

    rig.reducer.Reduce(rig.state, DismissDestination{});
    EXPECT_FALSE(rig.state.destination.has_value());
}

TEST(DailyChallenge_Runner, ConcurrentFetchesFeedBothResponses)
{
    FixedGameClock clock{T0()};
    FakeDailyApi api;
    api.delay = std::chrono::milliseconds(20);
    InMemoryNotificationCenter center{clock, true};
    DailyChallengeRunner runner{api, center, clock};
    DailyChallengeReducer reducer{clock};
    DailyChallengeState state{};

    DailyRunReport const report = runner.Run(reducer.Reduce(state, DailyTask{}));
    ASSERT_EQ(report.follow_ups.size(), 2u);
    EXPECT_EQ(api.fetches.load(), 1);

    for (DailyChallengeAction const& a : report.follow_ups) reducer.Reduce(state, a);
    EXPECT_EQ(state.daily_challenges.size(), 2u);
    ASSERT_TRUE(state.notification_settings.has_value());
    EXPECT_EQ(state.notification_settings->authorization_status, AuthorizationStatus::NotDetermined);
}

TEST(DailyChallenge_Runner, FetchFailureBecomesAFailedResponse)
{
    FixedGameClock clock{T0()};
    FakeDailyApi api;
    api.fail_fetch = true;
    InMemoryNotificationCenter center{clock, true};
    DailyChallengeRunner runner{api, center, clock};

    DailyRunReport const report =
        runner.Run(DailyEffect{{FetchTodaysChallenges{}}, Ordering::Sequential});
    ASSERT_EQ(report.follow_ups.size(), 1u);
    TodaysChallengesResponse const& r = std::get<TodaysChallengesResponse>(report.follow_ups[0]);
    ASSERT_FALSE(r.result.has_value());
    EXPECT_EQ(r.result.error().message, "offline");
}

TEST(DailyChallenge_Runner, StartThenStartGame)
{
    FixedGameClock clock{T0()};
    FakeDailyApi api;
    InMemoryNotificationCenter center{clock, true};
    DailyChallengeRunner runner{api, center, clock};
    DailyChallengeReducer reducer{clock};
    DailyChallengeState state{};
    state.daily_challenges = {Challenge(GameMode::Timed, false)};

    DailyRunReport const started = runner.Run(reducer.Reduce(state, GameButtonTapped{GameMode::Timed}));
    ASSERT_EQ(started.follow_ups.size(), 1u);

    DailyRunReport const launched = runner.Run(reducer.Reduce(state, started.follow_ups[0]));
    ASSERT_EQ(launched.started_games.size(), 1u);
    EXPECT_EQ(std::get<DailyChallengeContext>(launched.started_games[0].context).challenge_id, "daily-timed");
    EXPECT_FALSE(state.game_mode_is_loading.has_value());
}

TEST(DailyChallenge_Runner, ThrowingStartIsAnOtherError)
{
    FixedGameClock clock{T0()};
    FakeDailyApi api;
    api.fail_start = true;
    InMemoryNotificationCenter center{clock, true};
    DailyChallengeRunner runner{api, center, clock};

    DailyRunReport const report =
        runner.Run(DailyEffect{{StartChallenge{Challenge(GameMode::Timed, false)}}, Ordering::Sequential});
    ASSERT_EQ(report.follow_ups.size(), 1u);
    StartChallengeResponse const& r = std::get<StartChallengeResponse>(report.follow_ups[0]);
    ASSERT_FALSE(r.result.has_value());
    EXPECT_EQ(r.result.error().kind, DailyChallengeError::Kind::Other);
    EXPECT_EQ(r.result.error().detail, "timeout");
}

TEST(DailyChallenge_View, ButtonStates)
{
    TodaysDailyChallenge const ranked = Challenge(GameMode::Timed, true, 5);
    TodaysDailyChallenge const started = Challenge(GameMode::Timed, true);
    TodaysDailyChallenge const fresh = Challenge(GameMode::Timed, false);
    GameState const resume = DailyGame("daily-unlimited", 42);

    ButtonState const played = MakeButtonState(&ranked, nullptr);
    ASSERT_TRUE(std::holds_alternative<Played>(played));
    EXPECT_EQ(InactiveText(played), std::optional<std::string>{"Played\n#5 of 40"});

    ButtonState const unplayable = MakeButtonState(&started, nullptr);
    EXPECT_TRUE(std::holds_alternative<Unplayable>(unplayable));
    EXPECT_EQ(InactiveText(unplayable), std::optional<std::string>{"Played"});

    ButtonState const resuming = MakeButtonState(&started, &resume);
    ASSERT_TRUE(std::holds_alternative<Resume>(resuming));
    EXPECT_EQ(ResumeText(resuming), std::optional<std::string>{"42 pts"});
    EXPECT_FALSE(InactiveText(resuming).has_value());

    EXPECT_TRUE(std::holds_alternative<Playable>(MakeButtonState(&fresh, nullptr)));
    EXPECT_TRUE(std::holds_alternative<Playable>(MakeButtonState(nullptr, nullptr)));
    EXPECT_FALSE(ResumeText(MakeButtonState(nullptr, nullptr)).has_value());
    EXPECT_FALSE(ResumeText(Resume{0}).has_value());
}

TEST(DailyChallenge_View, FromState)
{
    DailyChallengeState state{};
    state.daily_challenges = {Challenge(GameMode::Timed, true, 1), Challenge(GameMode::Unlimited, true)};
    state.in_progress_unlimited = DailyGame("daily-unlimited", 7);
    state.game_mode_is_loading = GameMode::Unlimited;

    DailyChallengeViewState v = DailyChallengeViewState::From(state);
    EXPECT_EQ(v.number_of_players, 80);
    EXPECT_EQ(v.game_mode_is_loading, GameMode::Unlimited);
    EXPECT_TRUE(v.is_notification_status_determined);
    EXPECT_TRUE(std::holds_alternative<Played>(v.timed));
    EXPECT_TRUE(std::holds_alternative<Resume>(v.unlimited));

    state.notification_settings = UserNotificationSettings{AuthorizationStatus::NotDetermined};
    EXPECT_FALSE(DailyChallengeViewState::From(state).is_notification_status_determined);
    state.notification_settings = UserNotificationSettings{AuthorizationStatus::Provisional};
    EXPECT_FALSE(DailyChallengeViewState::From(state).is_notification_status_determined);
    state.notification_settings = UserNotificationSettings{AuthorizationStatus::Denied};
    EXPECT_TRUE(DailyChallengeViewState::From(state).is_notification_status_determined);
}

TEST(DailyChallenge_RelativeTime, Units)
{
    EXPECT_EQ(RelativeTime(T0(), T0()), "now");
    EXPECT_EQ(RelativeTime(T0(), T0() - std::chrono::hours(1)), "now");
    EXPECT_EQ(RelativeTime(T0(), T0() + std::chrono::minutes(1)), "in 1 minute");
    EXPECT_EQ(RelativeTime(T0(), T0() + std::chrono::minutes(59)), "in 59 minutes");
    EXPECT_EQ(RelativeTime(T0(), T0() + std::chrono::hours(1)), "in 1 hour");
    EXPECT_EQ(RelativeTime(T0(), T0() + std::chrono::hours(23)), "in 23 hours");
    EXPECT_EQ(RelativeTime(T0(), T0() + std::chrono::hours(24)), "in 1 day");
}
