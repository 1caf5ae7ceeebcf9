//
// WsMatchServiceClient.cpp
//
#include "WsMatchServiceClient.hpp"

#include <format>
#include <print>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace wordcube::net
{
    WsMatchServiceClient::WsMatchServiceClient(std::string url,
                                               core::PlayerId player_id,
                                               std::string display_name,
                                               std::chrono::milliseconds reply_timeout)
        : url_{std::move(url)}
          , reply_timeout_{reply_timeout}
          , player_{std::move(player_id), std::move(display_name), false}
    {
        ep_.clear_access_channels(websocketpp::log::alevel::all);
        ep_.clear_error_channels(websocketpp::log::elevel::all);
        ep_.init_asio();

        ep_.set_open_handler([this](websocketpp::connection_hdl hdl)
        {
            {
                std::lock_guard lock(mtx_);
                hdl_ = hdl;
                open_ = true;
            }
            cv_.notify_all();
        });

        ep_.set_close_handler([this](websocketpp::connection_hdl)
        {
            {
                std::lock_guard lock(mtx_);
                open_ = false;
                closed_ = true;
            }
            std::print("[Client] Connection closed.\n");
            cv_.notify_all();
        });

        ep_.set_fail_handler([this](websocketpp::connection_hdl)
        {
            {
                std::lock_guard lock(mtx_);
                closed_ = true;
            }
            cv_.notify_all();
        });

        ep_.set_message_handler([this](websocketpp::connection_hdl, WsClient::message_ptr msg)
        {
            OnMessage(std::move(msg));
        });
    }

    WsMatchServiceClient::~WsMatchServiceClient()
    {
        Close();
    }

    auto WsMatchServiceClient::Connect() -> void
    {
        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = ep_.get_connection(url_, ec);
        if (ec)
            WCB_THROW(core::error::Code::Network, std::format("get_connection({}) failed: {}", url_, ec.message()));

        ep_.connect(con);
        net_thr_ = std::thread([this] { ep_.run(); });

        std::unique_lock lk(mtx_);
        bool const ready = cv_.wait_for(lk, reply_timeout_, [&] { return open_ || closed_; });
        if (!ready || !open_)
            WCB_THROW(core::error::Code::Network, std::format("Could not connect to {}", url_));
        std::print("[Client] Connected to {}\n", url_);
    }

    auto WsMatchServiceClient::Close() -> void
    {
        bool was_open = false;
        websocketpp::connection_hdl hdl{};
        {
            std::lock_guard lock(mtx_);
            was_open = open_;
            hdl = hdl_;
        }
        if (was_open)
        {
            websocketpp::lib::error_code ec;
            ep_.close(hdl, websocketpp::close::status::normal, "bye", ec);
            if (ec) std::print("[Client] close() failed: {}\n", ec.message());
        }
        if (net_thr_.joinable())
        {
            if (!was_open) ep_.stop();
            net_thr_.join();
        }
    }

    auto WsMatchServiceClient::OnMessage(WsClient::message_ptr msg) -> void
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Client] Ignoring non-binary frame\n");
            return;
        }

        auto decoded = DecodeEnvelope(core::util::AsBytes(msg->get_payload()));
        if (!decoded)
        {
            std::print("[Client] Bad frame: {}\n", decoded.error().message);
            return;
        }

        {
            std::lock_guard lock(mtx_);
            if (decoded->msg_id == 0)
            {
                if (auto* ev = std::get_if<MatchEventMsg>(&decoded->body))
                    events_.push_back(std::move(ev->event));
            }
            else if (!replies_.Deliver(decoded->msg_id, std::move(decoded->body)))
            {
                std::print("[Client] Dropping reply to abandoned request {}\n", decoded->msg_id);
            }
        }
        cv_.notify_all();
    }

    auto WsMatchServiceClient::Request(Body body) -> Body
    {
        std::vector<std::uint8_t> frame;
        std::uint64_t id = 0;
        websocketpp::connection_hdl hdl{};
        {
            std::lock_guard lock(mtx_);
            if (!open_) WCB_THROW(core::error::Code::Network, "Not connected");
            id = next_id_++;
            hdl = hdl_;
            replies_.Await(id);
        }
        frame = EncodeEnvelope(Envelope{id, std::move(body)});

        websocketpp::lib::error_code ec;
        ep_.send(hdl, frame.data(), frame.size(), websocketpp::frame::opcode::binary, ec);

        std::unique_lock lk(mtx_);
        if (ec)
        {
            replies_.Abandon(id);
            WCB_THROW(core::error::Code::Network, std::format("send() failed: {}", ec.message()));
        }
        bool const got = cv_.wait_for(lk, reply_timeout_, [&] { return replies_.Ready(id) || closed_; });
        std::optional<Body> reply = replies_.Take(id);
        if (!reply)
        {
            if (!got) WCB_THROW(core::error::Code::Timeout, std::format("No reply to request {}", id));
            WCB_THROW(core::error::Code::Network, "Connection closed while waiting for a reply");
        }
        return std::move(*reply);
    }

    auto WsMatchServiceClient::RequestAck(Body body) -> void
    {
        Body reply = Request(std::move(body));
        AckMsg const* ack = std::get_if<AckMsg>(&reply);
        if (!ack) WCB_THROW(core::error::Code::Service, "Unexpected reply");
        if (!ack->ok) WCB_THROW(core::error::Code::Service, ack->error);
    }

    auto WsMatchServiceClient::Authenticate() -> void
    {
        core::LocalPlayer const me = LocalPlayer();
        Body reply = Request(HelloMsg{me.game_player_id, me.display_name});
        if (AckMsg const* ack = std::get_if<AckMsg>(&reply); ack && !ack->ok)
            WCB_THROW(core::error::Code::Service, ack->error);

        HelloAckMsg const* hello = std::get_if<HelloAckMsg>(&reply);
        if (!hello) WCB_THROW(core::error::Code::Service, "Unexpected reply to hello");
        if (!hello->player.is_authenticated) WCB_THROW(core::error::Code::Service, "Authentication refused");

        std::lock_guard lock(mtx_);
        player_ = hello->player;
        std::print("[Client] Authenticated as {} ({})\n", player_.display_name, player_.game_player_id);
    }

    auto WsMatchServiceClient::LocalPlayer() const -> core::LocalPlayer
    {
        std::lock_guard lock(mtx_);
        return player_;
    }

    auto WsMatchServiceClient::NextEvent(std::chrono::steady_clock::time_point deadline)
        -> std::optional<core::ListenerEvent>
    {
        std::unique_lock lk(mtx_);
        cv_.wait_until(lk, deadline, [&] { return !events_.empty() || closed_; });
        if (events_.empty())
        {
            if (closed_) WCB_THROW(core::error::Code::Network, "Connection closed");
            return std::nullopt;
        }
        core::ListenerEvent e = std::move(events_.front());
        events_.pop_front();
        return e;
    }

    auto WsMatchServiceClient::FindMatch() -> void
    {
        RequestAck(FindMatchMsg{});
    }

    auto WsMatchServiceClient::Rematch(core::MatchId const& match_id) -> core::TurnBasedMatch
    {
        Body reply = Request(RematchMsg{match_id});
        if (AckMsg const* ack = std::get_if<AckMsg>(&reply); ack && !ack->ok)
            WCB_THROW(core::error::Code::Service, ack->error);

        MatchReplyMsg* m = std::get_if<MatchReplyMsg>(&reply);
        if (!m) WCB_THROW(core::error::Code::Service, "Unexpected reply to rematch");
        return std::move(m->match);
    }

    auto WsMatchServiceClient::SaveCurrentTurn(core::MatchId const& match_id,
                                               std::span<std::uint8_t const> match_data) -> void
    {
        RequestAck(SaveTurnMsg{match_id, {match_data.begin(), match_data.end()}});
    }

    auto WsMatchServiceClient::EndTurn(core::MatchId const& match_id,
                                       std::span<std::uint8_t const> match_data,
                                       std::string const& message) -> void
    {
        RequestAck(EndTurnMsg{match_id, {match_data.begin(), match_data.end()}, message});
    }

    auto WsMatchServiceClient::EndMatchInTurn(EndMatchInTurnRequest const& request) -> void
    {
        RequestAck(EndMatchMsg{request.match_id, request.match_data, request.local_player_id,
                               request.local_player_outcome, request.message});
    }

    auto WsMatchServiceClient::QuitMatch(core::MatchId const& match_id) -> void
    {
        RequestAck(QuitMsg{match_id});
    }

    // No matchmaker UI in a headless client.
    auto WsMatchServiceClient::DismissMatchmaker() -> void
    {
        std::print("[Client] Matchmaker dismissed\n");
    }

    auto WsMatchServiceClient::ShowNotificationBanner(std::string const& title,
                                                      std::optional<std::string> const& message) -> void
    {
        std::print("[Client] Banner: {}{}\n", title, message ? " | " + *message : std::string{});
    }
}
