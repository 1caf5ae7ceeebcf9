//
// CommandRunner.cpp
//
#include "CommandRunner.hpp"

#include <exception>
#include <expected>
#include <future>
#include <print>
#include <string_view>
#include <type_traits>
#include <utility>

#include "../core/Exception.hpp"

namespace wordcube::app
{
    CommandRunner::CommandRunner(net::MatchServiceClient& client,
                                 GameStore& store,
                                 std::function<void()> start_listening)
        : client_{client}
          , store_{store}
          , start_listening_{std::move(start_listening)}
    {
    }

    auto CommandRunner::Run(core::Effect const& effect) -> RunReport
    {
        RunReport report{};
        auto merge = [&report](RunReport&& part)
        {
            for (CommandFailure& f : part.failures) report.failures.push_back(std::move(f));
            for (core::AppAction& a : part.follow_ups) report.follow_ups.push_back(std::move(a));
        };

        if (effect.ordering == core::Ordering::Sequential)
        {
            // the first failure ends the group
            for (core::Command const& c : effect.commands)
            {
                merge(RunOne(c));
                if (!report.Ok()) break;
            }
            return report;
        }

        // every sibling starts; every sibling is awaited
        std::vector<std::future<RunReport>> siblings;
        siblings.reserve(effect.commands.size());
        for (core::Command const& c : effect.commands)
        {
            siblings.push_back(std::async(std::launch::async, [this, &c] { return RunOne(c); }));
        }
        for (std::future<RunReport>& f : siblings)
        {
            merge(f.get());
        }
        return report;
    }

    auto CommandRunner::RunOne(core::Command const& command) -> RunReport
    {
        RunReport report{};
        std::string_view const name = core::CommandName(command);
        try
        {
            if (std::optional<core::AppAction> next = Execute(command))
            {
                report.follow_ups.push_back(std::move(*next));
            }
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[Runner] {} failed ({}): {}\n", name, core::error::to_string(e.data()), e.what());
            report.failures.push_back(CommandFailure{std::string{name}, e.what()});
        }
        catch (std::exception const& e)
        {
            std::print("[Runner] {} failed: {}\n", name, e.what());
            report.failures.push_back(CommandFailure{std::string{name}, e.what()});
        }

        // a failed rematch still answers the reducer
        if (!report.failures.empty() && std::holds_alternative<core::RequestRematch>(command))
        {
            report.follow_ups.emplace_back(
                core::RematchResponse{std::unexpected(core::ServiceFailure{report.failures.back().message})});
        }
        return report;
    }

    auto CommandRunner::Execute(core::Command const& command) -> std::optional<core::AppAction>
    {
        return std::visit(
            [&]<typename T0>(T0 const& c) -> std::optional<core::AppAction>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, core::AuthenticateLocalPlayer>)
                {
                    client_.Authenticate();
                }
                else if constexpr (std::is_same_v<T, core::StartListening>)
                {
                    if (start_listening_) start_listening_();
                }
                else if constexpr (std::is_same_v<T, core::DismissMatchmaker>)
                {
                    client_.DismissMatchmaker();
                }
                else if constexpr (std::is_same_v<T, core::SaveCurrentTurn>)
                {
                    client_.SaveCurrentTurn(c.match_id, c.match_data);
                }
                else if constexpr (std::is_same_v<T, core::EndMatchInTurn>)
                {
                    client_.EndMatchInTurn(net::EndMatchInTurnRequest{
                        c.match_id, c.match_data, c.local_player_id, c.local_player_outcome, c.message});
                }
                else if constexpr (std::is_same_v<T, core::ShowNotificationBanner>)
                {
                    client_.ShowNotificationBanner(c.title, c.message);
                }
                else if constexpr (std::is_same_v<T, core::RequestRematch>)
                {
                    return core::AppAction{core::RematchResponse{client_.Rematch(c.match_id)}};
                }
                else if constexpr (std::is_same_v<T, core::PersistGame>)
                {
                    store_.Save(c.game);
                }
                else static_assert(sizeof(T) == 0, "Unhandled command");
                return std::nullopt;
            },
            command);
    }
}
