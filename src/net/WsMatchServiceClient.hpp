//
// WsMatchServiceClient.hpp - match service client over WebSocket++
//

#ifndef WORDCUBE_WSMATCHSERVICECLIENT_HPP
#define WORDCUBE_WSMATCHSERVICECLIENT_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "MatchServiceClient.hpp"
#include "codec.hpp"

namespace wordcube::net
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    // Replies keyed by msg_id. Only ids a caller is still waiting for are kept;
    // a reply to an abandoned or unknown request is dropped. Not synchronized.
    class ReplyTable
    {
    public:
        auto Await(std::uint64_t id) -> void { awaited_.insert(id); }

        auto Deliver(std::uint64_t id, Body body) -> bool
        {
            if (!awaited_.contains(id)) return false;
            replies_.insert_or_assign(id, std::move(body));
            return true;
        }

        auto Ready(std::uint64_t id) const -> bool { return replies_.contains(id); }

        auto Take(std::uint64_t id) -> std::optional<Body>
        {
            awaited_.erase(id);
            auto it = replies_.find(id);
            if (it == replies_.end()) return std::nullopt;
            Body body = std::move(it->second);
            replies_.erase(it);
            return body;
        }

        auto Abandon(std::uint64_t id) -> void
        {
            awaited_.erase(id);
            replies_.erase(id);
        }

        auto Waiting() const -> std::size_t { return awaited_.size(); }
        auto Stored() const -> std::size_t { return replies_.size(); }

    private:
        std::set<std::uint64_t> awaited_;
        ReplyTable replies_;
    };

    // Requests carry a fresh msg_id and block for the reply with the same id.
    // Frames with msg_id 0 are pushed match events, queued for NextEvent().
    class WsMatchServiceClient final : public MatchServiceClient
    {
    public:
        WsMatchServiceClient(std::string url,
                             core::PlayerId player_id,
                             std::string display_name,
                             std::chrono::milliseconds reply_timeout = std::chrono::seconds{5});
        ~WsMatchServiceClient() override;

        WsMatchServiceClient(WsMatchServiceClient const&) = delete;
        auto operator=(WsMatchServiceClient const&) -> WsMatchServiceClient& = delete;

        // throws error::NetworkError
        auto Connect() -> void;
        auto Close() -> void;

        auto Authenticate() -> void override;
        auto LocalPlayer() const -> core::LocalPlayer override;
        auto NextEvent(std::chrono::steady_clock::time_point deadline)
            -> std::optional<core::ListenerEvent> override;
        auto FindMatch() -> void override;
        auto Rematch(core::MatchId const& match_id) -> core::TurnBasedMatch override;
        auto SaveCurrentTurn(core::MatchId const& match_id,
                             std::span<std::uint8_t const> match_data) -> void override;
        auto EndTurn(core::MatchId const& match_id,
                     std::span<std::uint8_t const> match_data,
                     std::string const& message) -> void override;
        auto EndMatchInTurn(EndMatchInTurnRequest const& request) -> void override;
        auto QuitMatch(core::MatchId const& match_id) -> void override;
        auto DismissMatchmaker() -> void override;
        auto ShowNotificationBanner(std::string const& title,
                                    std::optional<std::string> const& message) -> void override;

    private:
        auto Request(Body body) -> Body;
        auto RequestAck(Body body) -> void;
        auto OnMessage(WsClient::message_ptr msg) -> void;

        std::string url_;
        std::chrono::milliseconds reply_timeout_;

        WsClient ep_;
        websocketpp::connection_hdl hdl_;
        std::thread net_thr_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        bool open_{false};
        bool closed_{false};
        std::uint64_t next_id_{1};
        ReplyTable replies_;
        std::deque<core::ListenerEvent> events_;
        core::LocalPlayer player_;
    };
}

#endif //WORDCUBE_WSMATCHSERVICECLIENT_HPP
