//
// DailyChallenge.cpp
//
#include "DailyChallenge.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <numeric>
#include <print>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace wordcube::app
{
    auto RelativeTime(core::Timestamp now, core::Timestamp then) -> std::string
    {
        using namespace std::chrono;
        auto const d = duration_cast<minutes>(then - now);
        if (d.count() <= 0) return "now";
        if (d < hours{1}) return std::format("in {} minute{}", d.count(), d.count() == 1 ? "" : "s");
        auto const h = duration_cast<hours>(d).count();
        if (h < 24) return std::format("in {} hour{}", h, h == 1 ? "" : "s");
        auto const days = h / 24;
        return std::format("in {} day{}", days, days == 1 ? "" : "s");
    }

    auto AlreadyPlayedAlert(core::Timestamp now, core::Timestamp next_starts_at) -> DailyAlert
    {
        return DailyAlert{
            "Already played",
            std::format("You already played today's daily challenge. You can play the next one {}.",
                        RelativeTime(now, next_starts_at))};
    }

    auto CouldNotFetchDailyAlert(core::Timestamp now, core::Timestamp next_starts_at) -> DailyAlert
    {
        return DailyAlert{
            "Couldn't start today's daily",
            std::format("We're sorry. We were unable to fetch today's daily or you already started it "
                        "earlier today. You can play the next daily {}.",
                        RelativeTime(now, next_starts_at))};
    }

    DailyChallengeReducer::DailyChallengeReducer(core::GameClock const& clock)
        : clock_{clock}
    {
    }

    auto DailyChallengeReducer::Reduce(DailyChallengeState& state, DailyChallengeAction const& action) const
        -> DailyEffect
    {
        return std::visit(
            core::util::Overloaded{
                [&](DailyTask const&) -> DailyEffect
                {
                    return DailyEffect{{FetchNotificationSettings{}, FetchTodaysChallenges{core::Language::En}},
                                       core::Ordering::Concurrent};
                },
                [&](TodaysChallengesResponse const& r) -> DailyEffect
                {
                    if (r.result) state.daily_challenges = *r.result;
                    return {};
                },
                [&](GameButtonTapped const& a) -> DailyEffect { return OnGameButtonTapped(state, a.mode); },
                [&](StartChallengeResponse const& r) -> DailyEffect { return OnStartResponse(state, r); },
                [&](NotificationSettingsResponse const& r) -> DailyEffect
                {
                    state.notification_settings = r.settings;
                    return {};
                },
                [&](NotificationsAuthChosen const& r) -> DailyEffect
                {
                    state.notification_settings = r.settings;
                    return {};
                },
                [&](PresentDestination const& p) -> DailyEffect
                {
                    state.destination = p.destination;
                    return {};
                },
                [&](DismissDestination const&) -> DailyEffect
                {
                    state.destination.reset();
                    return {};
                },
            },
            action);
    }

    auto DailyChallengeReducer::OnGameButtonTapped(DailyChallengeState& state, core::GameMode mode) const
        -> DailyEffect
    {
        auto it = std::ranges::find(state.daily_challenges, mode,
                                    [](TodaysDailyChallenge const& c) { return c.daily_challenge.game_mode; });
        if (it == state.daily_challenges.end()) return {};

        bool playable = false;
        switch (it->daily_challenge.game_mode)
        {
        case core::GameMode::Timed:
            playable = !it->your_result.started;
            break;
        case core::GameMode::Unlimited:
            playable = !it->your_result.started || state.in_progress_unlimited.has_value();
            break;
        }

        if (!playable)
        {
            state.destination = AlreadyPlayedAlert(clock_.Now(), it->daily_challenge.ends_at);
            return {};
        }

        state.game_mode_is_loading = it->daily_challenge.game_mode;
        return DailyEffect{{StartChallenge{*it}}, core::Ordering::Sequential};
    }

    auto DailyChallengeReducer::OnStartResponse(DailyChallengeState& state, StartChallengeResponse const& response) const
        -> DailyEffect
    {
        if (response.result)
        {
            state.game_mode_is_loading.reset();
            return DailyEffect{{StartGame{*response.result}}, core::Ordering::Sequential};
        }

        DailyChallengeError const& e = response.result.error();
        switch (e.kind)
        {
        case DailyChallengeError::Kind::AlreadyPlayed:
            state.destination = AlreadyPlayedAlert(clock_.Now(), e.next_starts_at);
            state.game_mode_is_loading.reset();
            break;
        case DailyChallengeError::Kind::CouldNotFetch:
            state.destination = CouldNotFetchDailyAlert(clock_.Now(), e.next_starts_at);
            state.game_mode_is_loading.reset();
            break;
        case DailyChallengeError::Kind::Other:
            break;
        }
        return {};
    }

    DailyChallengeRunner::DailyChallengeRunner(DailyChallengeApi& api,
                                               UserNotificationClient& notifications,
                                               core::GameClock const& clock)
        : api_{api}
          , notifications_{notifications}
          , clock_{clock}
    {
    }

    auto DailyChallengeRunner::Run(DailyEffect const& effect) -> DailyRunReport
    {
        DailyRunReport report{};
        if (effect.ordering == core::Ordering::Sequential)
        {
            for (DailyCommand const& c : effect.commands) Execute(c, report);
            return report;
        }

        std::vector<std::future<DailyRunReport>> siblings;
        siblings.reserve(effect.commands.size());
        for (DailyCommand const& c : effect.commands)
        {
            siblings.push_back(std::async(std::launch::async, [this, &c]
            {
                DailyRunReport part{};
                Execute(c, part);
                return part;
            }));
        }
        for (std::future<DailyRunReport>& f : siblings)
        {
            DailyRunReport part = f.get();
            for (auto& a : part.follow_ups) report.follow_ups.push_back(std::move(a));
            for (auto& g : part.started_games) report.started_games.push_back(std::move(g));
        }
        return report;
    }

    auto DailyChallengeRunner::Execute(DailyCommand const& command, DailyRunReport& report) -> void
    {
        std::visit(
            core::util::Overloaded{
                [&](FetchNotificationSettings const&)
                {
                    report.follow_ups.emplace_back(NotificationSettingsResponse{notifications_.NotificationSettings()});
                },
                [&](FetchTodaysChallenges const& c)
                {
                    try
                    {
                        report.follow_ups.emplace_back(TodaysChallengesResponse{api_.TodaysChallenges(c.language)});
                    }
                    catch (core::OmegaException<core::error::Code> const& e)
                    {
                        std::print("[Daily] Fetching today's challenges failed: {}\n", e.what());
                        report.follow_ups.emplace_back(
                            TodaysChallengesResponse{std::unexpected(core::ServiceFailure{e.what()})});
                    }
                },
                [&](StartChallenge const& c)
                {
                    try
                    {
                        report.follow_ups.emplace_back(StartChallengeResponse{api_.Start(c.challenge, clock_.Now())});
                    }
                    catch (core::OmegaException<core::error::Code> const& e)
                    {
                        std::print("[Daily] Starting {} failed: {}\n", c.challenge.daily_challenge.id, e.what());
                        report.follow_ups.emplace_back(StartChallengeResponse{std::unexpected(DailyChallengeError{
                            DailyChallengeError::Kind::Other, c.challenge.daily_challenge.ends_at, e.what()})});
                    }
                },
                [&](StartGame const& c) { report.started_games.push_back(c.game); },
            },
            command);
    }

    auto MakeButtonState(TodaysDailyChallenge const* fetched, core::GameState const* in_progress) -> ButtonState
    {
        if (fetched && fetched->your_result.rank)
        {
            return Played{*fetched->your_result.rank, fetched->your_result.out_of};
        }
        if (in_progress)
        {
            return Resume{in_progress->CurrentScore()};
        }
        if (fetched && fetched->your_result.started)
        {
            return Unplayable{};
        }
        return Playable{};
    }

    auto InactiveText(ButtonState const& s) -> std::optional<std::string>
    {
        return std::visit(
            core::util::Overloaded{
                [](Played const& p) -> std::optional<std::string>
                {
                    return std::format("Played\n#{} of {}", p.rank, p.out_of);
                },
                [](Playable const&) -> std::optional<std::string> { return std::nullopt; },
                [](Resume const&) -> std::optional<std::string> { return std::nullopt; },
                [](Unplayable const&) -> std::optional<std::string> { return "Played"; },
            },
            s);
    }

    auto ResumeText(ButtonState const& s) -> std::optional<std::string>
    {
        if (Resume const* r = std::get_if<Resume>(&s); r && r->current_score > 0)
        {
            return std::format("{} pts", r->current_score);
        }
        return std::nullopt;
    }

    auto NumberOfPlayers(std::vector<TodaysDailyChallenge> const& challenges) -> int32_t
    {
        return std::accumulate(challenges.cbegin(), challenges.cend(), int32_t{0},
                               [](int32_t acc, TodaysDailyChallenge const& c) { return acc + c.your_result.out_of; });
    }

    auto DailyChallengeViewState::From(DailyChallengeState const& state) -> DailyChallengeViewState
    {
        auto find = [&](core::GameMode mode) -> TodaysDailyChallenge const*
        {
            auto it = std::ranges::find(state.daily_challenges, mode,
                                        [](TodaysDailyChallenge const& c) { return c.daily_challenge.game_mode; });
            return it == state.daily_challenges.end() ? nullptr : &*it;
        };

        DailyChallengeViewState v{};
        v.game_mode_is_loading = state.game_mode_is_loading;
        // no settings yet counts as determined
        if (state.notification_settings)
        {
            AuthorizationStatus const s = state.notification_settings->authorization_status;
            v.is_notification_status_determined =
                s != AuthorizationStatus::NotDetermined && s != AuthorizationStatus::Provisional;
        }
        else
        {
            v.is_notification_status_determined = true;
        }
        v.number_of_players = NumberOfPlayers(state.daily_challenges);
        v.timed = MakeButtonState(find(core::GameMode::Timed), nullptr);
        v.unlimited = MakeButtonState(find(core::GameMode::Unlimited),
                                      state.in_progress_unlimited ? &*state.in_progress_unlimited : nullptr);
        return v;
    }
}
