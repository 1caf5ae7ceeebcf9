//
// ClientMain.cpp - headless client: authenticates, listens and reconciles match events
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <thread>

#include "core/Actions.hpp"
#include "core/Clock.hpp"
#include "core/Cubes.hpp"
#include "core/Exception.hpp"
#include "core/State.hpp"
#include "core/Types.hpp"
#include "app/AppStore.hpp"
#include "app/Autoplay.hpp"
#include "app/GameStore.hpp"
#include "app/Reconciler.hpp"
#include "debug/AuditLogger.hpp"
#include "net/WsMatchServiceClient.hpp"

namespace
{
    struct ClientConfig
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::string player_id{"player-1"};
        std::string name{};
        bool find_match{false};
        wordcube::app::AutoplayMode autoplay{wordcube::app::AutoplayMode::Off};
        // 0 = until the server goes away
        std::uint64_t run_secs{0};
        wordcube::core::Config core{};
    };

    auto ParseArgs(int argc, char** argv) -> ClientConfig
    {
        ClientConfig cfg{};

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
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--url")
            {
                next_str(cfg.url);
            }
            else if (arg == "--player-id")
            {
                next_str(cfg.player_id);
            }
            else if (arg == "--name")
            {
                next_str(cfg.name);
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.core.seed = v; }
            }
            else if (arg == "--games-dir")
            {
                std::string v{};
                if (next_str(v)) { cfg.core.games_dir = v; }
            }
            else if (arg == "--audit-log")
            {
                std::string v{};
                if (next_str(v)) { cfg.core.audit_log = v; }
            }
            else if (arg == "--recent-turn-secs")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.core.recent_turn_window = std::chrono::seconds(v); }
            }
            else if (arg == "--find-match")
            {
                cfg.find_match = true;
            }
            else if (arg == "--autoplay")
            {
                std::string v{};
                if (next_str(v))
                {
                    if (v == "end-turn") { cfg.autoplay = wordcube::app::AutoplayMode::EndTurn; }
                    else if (v == "quit") { cfg.autoplay = wordcube::app::AutoplayMode::Quit; }
                    else { std::print("[Client] unknown --autoplay mode '{}', ignoring\n", v); }
                }
            }
            else if (arg == "--run-secs")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.run_secs = v; }
            }
        }
        if (cfg.name.empty())
        {
            cfg.name = cfg.player_id;
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace wordcube;

    ClientConfig const cc = ParseArgs(argc, argv);
    std::print("[Client] {} ({}) connecting to {} | seed={}\n", cc.name, cc.player_id, cc.url, cc.core.seed);

    net::WsMatchServiceClient client(cc.url, cc.player_id, cc.name);
    try
    {
        client.Connect();
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print("[Client] {}\n", e.what());
        return 2;
    }

    core::SystemGameClock clock;
    core::RandomCubeGenerator cubes(cc.core.seed);

    app::ReconcilerEnv env{
        clock,
        cubes,
        [&client] { return client.LocalPlayer(); },
        [&client]() -> std::optional<core::PlayerId>
        {
            core::LocalPlayer const p = client.LocalPlayer();
            if (!p.is_authenticated) return std::nullopt;
            return p.game_player_id;
        },
        [](core::MatchId const& id, core::error::TurnDataError const& err)
        {
            std::print("[Client] dropped event for {}: {}\n", id, core::error::describe(err));
        },
        cc.core.recent_turn_window
    };

    app::FileGameStore games(cc.core.games_dir);

    std::unique_ptr<debug::AuditLogger> audit;
    if (!cc.core.audit_log.empty())
    {
        audit = std::make_unique<debug::AuditLogger>(cc.core.audit_log.string());
        audit->start(cc.player_id, cc.core.seed);
    }

    app::AppStore store(app::TurnReconciler(std::move(env)), client, games, audit.get());
    store.Start();
    store.Send(core::DidFinishLaunching{});

    if (!store.WaitIdle(std::chrono::steady_clock::now() + std::chrono::seconds(10)))
    {
        std::print("[Client] launch did not settle\n");
    }

    if (cc.find_match)
    {
        if (!client.LocalPlayer().is_authenticated)
        {
            std::print("[Client] not authenticated, skipping matchmaking\n");
        }
        else
        {
            try
            {
                client.FindMatch();
            }
            catch (core::OmegaException<core::error::Code> const& e)
            {
                std::print("[Client] FindMatch failed: {}\n", e.what());
            }
        }
    }

    app::Autoplay autoplay(client, cc.autoplay);

    std::chrono::steady_clock::time_point const stop_at =
        std::chrono::steady_clock::now() + std::chrono::seconds(cc.run_secs);
    std::string last_screen{};
    while ((cc.run_secs == 0 || std::chrono::steady_clock::now() < stop_at) && store.IsListening())
    {
        std::string const screen = debug::DescribeScreen(store.State().destination);
        if (screen != last_screen)
        {
            std::print("[Client] screen: {}\n", screen);
            last_screen = screen;
        }
        try
        {
            autoplay.Tick(store.State().destination);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[Client] autoplay failed: {}\n", e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    store.Stop();
    client.Close();

    for (app::CommandFailure const& f : store.Failures())
    {
        std::print("[Client] {} failed: {}\n", f.command, f.message);
    }
    std::print("[Client] done | final screen: {}\n", debug::DescribeScreen(store.State().destination));

    return 0;
}
