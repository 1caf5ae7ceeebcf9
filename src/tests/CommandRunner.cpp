#include <gtest/gtest.h>
#include <chrono>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Effects.hpp"
#include "../core/Exception.hpp"
#include "../app/CommandRunner.hpp"
#include "../app/GameStore.hpp"
#include "../debug/RecordingMatchService.hpp"

#include "Fixtures.hpp"

using namespace wordcube::core;
using namespace wordcube::test;
using wordcube::app::CommandRunner;
using wordcube::app::RunReport;
using wordcube::debug::RecordingMatchService;

namespace
{
    class MemoryGameStore final : public wordcube::app::GameStore
    {
    public:
        auto Save(GameState const& game) -> void override
        {
            std::lock_guard lock(mtx_);
            if (fail_) WCB_THROW(error::Code::Storage, "disk full");
            saved_.push_back(game);
        }

        auto FailSaves() -> void
        {
            std::lock_guard lock(mtx_);
            fail_ = true;
        }

        auto Saved() const -> std::size_t
        {
            std::lock_guard lock(mtx_);
            return saved_.size();
        }

    private:
        mutable std::mutex mtx_;
        bool fail_{false};
        std::vector<GameState> saved_;
    };

    struct Rig
    {
        RecordingMatchService service{Me()};
        MemoryGameStore store{};
        int listen_calls{0};
        CommandRunner runner{service, store, [this] { ++listen_calls; }};
    };
}

TEST(CommandRunner_Sequential, RunsCommandsInOrder)
{
    Rig rig;
    RunReport const report = rig.runner.Run(Effect{{AuthenticateLocalPlayer{}, StartListening{}, DismissMatchmaker{}},
                                                   Ordering::Sequential});

    EXPECT_TRUE(report.Ok());
    EXPECT_TRUE(report.follow_ups.empty());
    EXPECT_EQ(rig.listen_calls, 1);

    std::vector<RecordingMatchService::Call> const calls = rig.service.Calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, "Authenticate");
    EXPECT_EQ(calls[1].method, "DismissMatchmaker");
    EXPECT_TRUE(rig.service.LocalPlayer().is_authenticated);
}

TEST(CommandRunner_Sequential, FailureEndsTheGroup)
{
    Rig rig;
    rig.service.Fail("Authenticate", "not signed in");
    RunReport const report = rig.runner.Run(Effect{{AuthenticateLocalPlayer{}, StartListening{}, DismissMatchmaker{}},
                                                   Ordering::Sequential});

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].command, "Authenticate");
    EXPECT_EQ(report.failures[0].message, "not signed in");
    EXPECT_EQ(rig.listen_calls, 0);
    EXPECT_EQ(rig.service.CallCount("DismissMatchmaker"), 0u);
    EXPECT_FALSE(rig.service.LocalPlayer().is_authenticated);
}

TEST(CommandRunner_Sequential, FailureInTheMiddleKeepsEarlierWork)
{
    Rig rig;
    rig.service.Fail("SaveCurrentTurn", "not your turn");
    RunReport const report = rig.runner.Run(Effect{{DismissMatchmaker{}, SaveCurrentTurn{"m-1", {1, 2}},
                                                    ShowNotificationBanner{"Your turn", std::nullopt}},
                                                   Ordering::Sequential});

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].command, "SaveCurrentTurn");
    EXPECT_EQ(rig.service.CallCount("DismissMatchmaker"), 1u);
    EXPECT_EQ(rig.service.CallCount("ShowNotificationBanner"), 0u);
}

TEST(CommandRunner_Concurrent, SiblingFailureCancelsNothing)
{
    Rig rig;
    rig.service.Fail("DismissMatchmaker", "no matchmaker");
    rig.service.Delay("SaveCurrentTurn", std::chrono::milliseconds(50));

    RunReport const report = rig.runner.Run(Effect{{DismissMatchmaker{}, SaveCurrentTurn{"m-1", {7, 7, 7}}},
                                                   Ordering::Concurrent});

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].command, "DismissMatchmaker");
    ASSERT_EQ(rig.service.CallCount("SaveCurrentTurn"), 1u);

    for (RecordingMatchService::Call const& c : rig.service.Calls())
    {
        if (c.method == "SaveCurrentTurn")
        {
            EXPECT_EQ(c.match_id, "m-1");
            EXPECT_EQ(c.data, (std::vector<uint8_t>{7, 7, 7}));
        }
    }
}

TEST(CommandRunner_Concurrent, SiblingsOverlap)
{
    Rig rig;
    rig.service.Delay("DismissMatchmaker", std::chrono::milliseconds(300));
    rig.service.Delay("SaveCurrentTurn", std::chrono::milliseconds(300));

    auto const started = std::chrono::steady_clock::now();
    RunReport const report = rig.runner.Run(Effect{{DismissMatchmaker{}, SaveCurrentTurn{"m-1", {}}},
                                                   Ordering::Concurrent});
    auto const took = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(report.Ok());
    EXPECT_LT(took, std::chrono::milliseconds(550));
}

TEST(CommandRunner_Rematch, SuccessFeedsMatchBack)
{
    Rig rig;
    rig.service.SetRematch(MakeMatch("m-2", 0));

    RunReport const report = rig.runner.Run(Effect{{RequestRematch{"m-1"}}, Ordering::Sequential});

    EXPECT_TRUE(report.Ok());
    ASSERT_EQ(report.follow_ups.size(), 1u);
    RematchResponse const* r = std::get_if<RematchResponse>(&report.follow_ups[0]);
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->result.has_value());
    EXPECT_EQ(r->result->match_id, "m-2");
}

TEST(CommandRunner_Rematch, FailureIsReportedAndFedBack)
{
    Rig rig;
    RunReport const report = rig.runner.Run(Effect{{RequestRematch{"m-1"}}, Ordering::Sequential});

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].command, "RequestRematch");
    ASSERT_EQ(report.follow_ups.size(), 1u);
    RematchResponse const* r = std::get_if<RematchResponse>(&report.follow_ups[0]);
    ASSERT_NE(r, nullptr);
    EXPECT_FALSE(r->result.has_value());
}

TEST(CommandRunner_Forwarding, EndMatchAndBannerReachTheService)
{
    Rig rig;
    EndMatchInTurn end{"m-1", {9}, Me().game_player_id, MatchOutcome::Quit, "Blob forfeited the match."};
    RunReport const report = rig.runner.Run(
        Effect{{end, ShowNotificationBanner{"Your turn", std::nullopt}}, Ordering::Sequential});

    EXPECT_TRUE(report.Ok());
    std::vector<RecordingMatchService::Call> const calls = rig.service.Calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, "EndMatchInTurn");
    EXPECT_EQ(calls[0].text, "Blob forfeited the match.");
    EXPECT_EQ(calls[0].data, (std::vector<uint8_t>{9}));
    EXPECT_EQ(calls[1].method, "ShowNotificationBanner");
    EXPECT_EQ(calls[1].text, "Your turn");
}

TEST(CommandRunner_Persist, SavesAndReportsStorageErrors)
{
    Rig rig;
    GameState game = GameState::FromTurnBasedMatch(T0(), Me(), MakeMatch("m-1", 0), SampleData());

    EXPECT_TRUE(rig.runner.Run(Effect{{PersistGame{game}}, Ordering::Sequential}).Ok());
    EXPECT_EQ(rig.store.Saved(), 1u);

    rig.store.FailSaves();
    RunReport const report = rig.runner.Run(Effect{{PersistGame{game}}, Ordering::Sequential});
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].command, "PersistGame");
    EXPECT_EQ(report.failures[0].message, "disk full");
}
