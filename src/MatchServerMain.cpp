//
// MatchServerMain.cpp - turn based match service over WebSocket++
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Clock.hpp"
#include "core/Exception.hpp"
#include "net/MatchServer.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        // 0 = until killed
        std::uint64_t run_secs{0};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--run-secs")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.run_secs = v; }
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace wordcube;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[Server] starting on port {}\n", sc.port);

    core::SystemGameClock clock;
    net::MatchServer matches(clock);

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
                               websocketpp::log::alevel::disconnect);
    server.init_asio();
    server.set_reuse_addr(true);

    std::mutex map_mx;
    std::map<Hdl, net::ConnId, std::owner_less<Hdl>> hdl_to_conn;
    std::map<net::ConnId, Hdl> conn_to_hdl;
    net::ConnId next_conn{1};

    auto send_all = [&](std::vector<net::Outbound> const& out)
    {
        for (net::Outbound const& o : out)
        {
            Hdl hdl{};
            {
                std::lock_guard<std::mutex> g(map_mx);
                auto it = conn_to_hdl.find(o.to);
                if (it == conn_to_hdl.end()) { continue; }
                hdl = it->second;
            }

            std::vector<std::uint8_t> const bytes = net::EncodeEnvelope(o.envelope);
            websocketpp::lib::error_code ec;
            server.send(hdl, bytes.data(), bytes.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[Server] send to conn {} failed: {}\n", o.to, ec.message());
            }
        }
    };

    server.set_open_handler([&](Hdl hdl)
    {
        std::lock_guard<std::mutex> g(map_mx);
        net::ConnId const id = next_conn++;
        hdl_to_conn[hdl] = id;
        conn_to_hdl[id] = hdl;
        std::print("[Server] conn {} opened\n", id);
    });

    server.set_close_handler([&](Hdl hdl)
    {
        std::optional<net::ConnId> id{};
        {
            std::lock_guard<std::mutex> g(map_mx);
            auto it = hdl_to_conn.find(hdl);
            if (it != hdl_to_conn.end())
            {
                id = it->second;
                conn_to_hdl.erase(it->second);
                hdl_to_conn.erase(it);
            }
        }
        if (id)
        {
            matches.Disconnect(*id);
            std::print("[Server] conn {} closed\n", *id);
        }
    });

    server.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame\n");
            return;
        }

        net::ConnId from{};
        {
            std::lock_guard<std::mutex> g(map_mx);
            auto it = hdl_to_conn.find(hdl);
            if (it == hdl_to_conn.end()) { return; }
            from = it->second;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        std::expected<net::Envelope, net::ParseError> env = net::DecodeEnvelope(bytes);
        if (!env)
        {
            std::print("[Server] conn {} sent a bad frame: {}\n", from, env.error().message);
            return;
        }

        try
        {
            send_all(matches.Handle(from, *env));
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[Server] conn {} request failed: {}\n", from, e.what());
        }
    });

    server.listen(sc.port);
    server.start_accept();
    std::thread net_thr([&server]
    {
        server.run();
    });

    if (sc.run_secs > 0)
    {
        std::this_thread::sleep_for(std::chrono::seconds(sc.run_secs));
        std::print("[Server] shutting down | {} match(es) hosted\n", matches.MatchCount());
        server.stop_listening();
        server.stop();
    }

    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return 0;
}
