//
// RecordingMatchService.hpp
//

#ifndef WORDCUBE_RECORDINGMATCHSERVICE_HPP
#define WORDCUBE_RECORDINGMATCHSERVICE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"
#include "../net/MatchServiceClient.hpp"

namespace wordcube::debug
{
    // Scripted match service: records every call, answers from a script, fails on request.
    class RecordingMatchService final : public net::MatchServiceClient
    {
    public:
        struct Call
        {
            std::string method;
            core::MatchId match_id{};
            std::vector<std::uint8_t> data{};
            std::string text{};
        };

        explicit RecordingMatchService(core::LocalPlayer player)
            : player_{std::move(player)}
        {
        }

        auto Authenticate() -> void override
        {
            Enter(Call{"Authenticate"});
            std::lock_guard lock(mtx_);
            player_.is_authenticated = true;
        }

        auto LocalPlayer() const -> core::LocalPlayer override
        {
            std::lock_guard lock(mtx_);
            return player_;
        }

        auto NextEvent(std::chrono::steady_clock::time_point deadline)
            -> std::optional<core::ListenerEvent> override
        {
            std::unique_lock lk(mtx_);
            cv_.wait_until(lk, deadline, [&] { return !events_.empty(); });
            if (events_.empty()) return std::nullopt;
            core::ListenerEvent e = std::move(events_.front());
            events_.pop_front();
            return e;
        }

        auto FindMatch() -> void override { Enter(Call{"FindMatch"}); }

        auto Rematch(core::MatchId const& match_id) -> core::TurnBasedMatch override
        {
            Enter(Call{"Rematch", match_id});
            std::lock_guard lock(mtx_);
            if (!rematch_)
                WCB_THROW(core::error::Code::Service, "No rematch scripted for " + match_id);
            return *rematch_;
        }

        auto SaveCurrentTurn(core::MatchId const& match_id, std::span<std::uint8_t const> match_data) -> void override
        {
            Enter(Call{"SaveCurrentTurn", match_id, {match_data.begin(), match_data.end()}});
        }

        auto EndTurn(core::MatchId const& match_id,
                     std::span<std::uint8_t const> match_data,
                     std::string const& message) -> void override
        {
            Enter(Call{"EndTurn", match_id, {match_data.begin(), match_data.end()}, message});
        }

        auto EndMatchInTurn(net::EndMatchInTurnRequest const& request) -> void override
        {
            Enter(Call{"EndMatchInTurn", request.match_id, request.match_data, request.message});
        }

        auto QuitMatch(core::MatchId const& match_id) -> void override { Enter(Call{"QuitMatch", match_id}); }

        auto DismissMatchmaker() -> void override { Enter(Call{"DismissMatchmaker"}); }

        auto ShowNotificationBanner(std::string const& title,
                                    std::optional<std::string> const& message) -> void override
        {
            Enter(Call{"ShowNotificationBanner", {}, {}, title + (message ? "|" + *message : "")});
        }

        // ----- script -----

        auto Push(core::ListenerEvent event) -> void
        {
            {
                std::lock_guard lock(mtx_);
                events_.push_back(std::move(event));
            }
            cv_.notify_all();
        }

        // Every later call to `method` throws error::ServiceError(message).
        auto Fail(std::string method, std::string message) -> void
        {
            std::lock_guard lock(mtx_);
            failures_[std::move(method)] = std::move(message);
        }

        // Calls to `method` take this long before answering.
        auto Delay(std::string method, std::chrono::milliseconds d) -> void
        {
            std::lock_guard lock(mtx_);
            delays_[std::move(method)] = d;
        }

        auto SetRematch(core::TurnBasedMatch match) -> void
        {
            std::lock_guard lock(mtx_);
            rematch_ = std::move(match);
        }

        auto Calls() const -> std::vector<Call>
        {
            std::lock_guard lock(mtx_);
            return calls_;
        }

        auto CallCount(std::string const& method) const -> std::size_t
        {
            std::lock_guard lock(mtx_);
            return static_cast<std::size_t>(std::ranges::count(calls_, method, &Call::method));
        }

    private:
        auto Enter(Call call) -> void
        {
            std::optional<std::string> fail{};
            std::chrono::milliseconds delay{0};
            std::string const method = call.method;
            {
                std::lock_guard lock(mtx_);
                calls_.push_back(std::move(call));
                if (auto it = failures_.find(method); it != failures_.end()) fail = it->second;
                if (auto it = delays_.find(method); it != delays_.end()) delay = it->second;
            }
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
            if (fail) WCB_THROW(core::error::Code::Service, *fail);
        }

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        core::LocalPlayer player_;
        std::deque<core::ListenerEvent> events_;
        std::map<std::string, std::string> failures_;
        std::map<std::string, std::chrono::milliseconds> delays_;
        std::optional<core::TurnBasedMatch> rematch_;
        std::vector<Call> calls_;
    };
}

#endif //WORDCUBE_RECORDINGMATCHSERVICE_HPP
