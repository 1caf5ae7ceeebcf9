#include "AuditLogger.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <variant>

#include "../core/Util.hpp"

using namespace wordcube::core;

namespace
{

auto s_match(TurnBasedMatch const& m) -> std::string
{
    return std::format("{} status={} data={}B", m.match_id, static_cast<int>(m.status), m.match_data.size());
}

auto s_event(ListenerEvent const& e) -> std::string
{
    return std::visit(
        util::Overloaded{
            [](MatchEnded const& ev) -> std::string { return std::format("MatchEnded({})", s_match(ev.match)); },
            [](ReceivedTurnEvent const& ev) -> std::string
            {
                return std::format("ReceivedTurn({}{})", s_match(ev.match), ev.did_become_active ? " active" : "");
            },
            [](WantsToQuitMatch const& ev) -> std::string { return std::format("WantsToQuit({})", s_match(ev.match)); },
        },
        e
    );
}

auto s_command(Command const& c) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& cmd) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SaveCurrentTurn>)
            {
                return std::format("SaveCurrentTurn({} {}B)", cmd.match_id, cmd.match_data.size());
            }
            else if constexpr (std::is_same_v<T, EndMatchInTurn>)
            {
                return std::format("EndMatchInTurn({} \"{}\")", cmd.match_id, cmd.message);
            }
            else if constexpr (std::is_same_v<T, ShowNotificationBanner>)
            {
                return std::format("ShowNotificationBanner(\"{}\")", cmd.title);
            }
            else if constexpr (std::is_same_v<T, RequestRematch>)
            {
                return std::format("RequestRematch({})", cmd.match_id);
            }
            else
            {
                return std::string{CommandName(c)};
            }
        },
        c
    );
}

} // anonymous namespace

namespace wordcube::debug
{

auto DescribeAction(AppAction const& action) -> std::string
{
    return std::visit(
        util::Overloaded{
            [](DidFinishLaunching const&) -> std::string { return "DidFinishLaunching"; },
            [](ListenerEvent const& e) -> std::string { return s_event(e); },
            [](GameOverRematchTapped const&) -> std::string { return "GameOverRematchTapped"; },
            [](ActiveGameRematchTapped const& a) -> std::string
            {
                return std::format("ActiveGameRematchTapped({})", a.match_id);
            },
            [](PastGameOpened const& a) -> std::string { return std::format("PastGameOpened({})", s_match(a.match)); },
            [](RematchResponse const& r) -> std::string
            {
                return r.result ? std::format("RematchResponse({})", s_match(*r.result))
                                : std::format("RematchResponse(failed: {})", r.result.error().message);
            },
        },
        action
    );
}

auto DescribeScreen(Destination const& destination) -> std::string
{
    ScreenSummary const s = Summarize(destination);
    switch (s.phase)
    {
        case ScreenPhase::Idle:     return "Idle";
        case ScreenPhase::Viewing:  return std::format("Viewing({})", s.match_id.value_or("solo"));
        case ScreenPhase::Finished: return std::format("Finished({})", s.match_id.value_or("solo"));
    }
    return "?";
}

auto DescribeEffect(Effect const& effect) -> std::string
{
    std::string body;
    for (size_t i{}; i < effect.commands.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_command(effect.commands[i]);
    }
    return std::format("[{}]{}", body, effect.ordering == Ordering::Concurrent ? " concurrent" : "");
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::string_view player_id, std::uint64_t seed) -> void
{
    std::lock_guard lock(mtx_);
    out_ << std::format("Player={}\n", player_id);
    out_ << std::format("Seed={}\n", seed);
    out_.flush();
}

auto AuditLogger::step(AppAction const& action, AppState const& state, Effect const& effect) -> void
{
    std::lock_guard lock(mtx_);
    ++steps_;
    out_ << std::format("Step {} action={}\n", steps_, DescribeAction(action));
    out_ << std::format("Screen: {}\n", DescribeScreen(state.destination));
    out_ << std::format("Commands: {}\n", DescribeEffect(effect));
}

auto AuditLogger::failure(std::string_view command, std::string_view message) -> void
{
    std::lock_guard lock(mtx_);
    out_ << std::format("Failed: {} | {}\n", command, message);
    out_.flush();
}

auto AuditLogger::end(AppState const& state) -> void
{
    std::lock_guard lock(mtx_);
    out_ << std::format("End steps={} screen={}\n", steps_, DescribeScreen(state.destination));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard lock(mtx_);
    out_.flush();
}

} // namespace wordcube::debug
