#include <gtest/gtest.h>
#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "../core/Actions.hpp"
#include "../core/Effects.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../debug/AuditLogger.hpp"

#include "Fixtures.hpp"

using namespace wordcube::core;
using namespace wordcube::debug;
using namespace wordcube::test;

TEST(AuditLogger_Describe, Actions)
{
    EXPECT_EQ(DescribeAction(AppAction{DidFinishLaunching{}}), "DidFinishLaunching");
    EXPECT_EQ(DescribeAction(AppAction{ActiveGameRematchTapped{"m-3"}}), "ActiveGameRematchTapped(m-3)");
    EXPECT_EQ(DescribeAction(AppAction{ListenerEvent{ReceivedTurnEvent{MakeMatch("m-1", 0, {1, 2}), true}}}),
              "ReceivedTurn(m-1 status=1 data=2B active)");
    EXPECT_EQ(DescribeAction(AppAction{RematchResponse{std::unexpected(ServiceFailure{"nope"})}}),
              "RematchResponse(failed: nope)");
}

TEST(AuditLogger_Describe, Screens)
{
    EXPECT_EQ(DescribeScreen(Destination{NoDestination{}}), "Idle");

    GameState const game = GameState::FromTurnBasedMatch(T0(), Me(), MakeMatch("m-1", 0), SampleData());
    EXPECT_EQ(DescribeScreen(Destination{game}), "Viewing(m-1)");
    EXPECT_EQ(DescribeScreen(Destination{MakeGameOver(game)}), "Finished(m-1)");
}

TEST(AuditLogger_Describe, Effects)
{
    EXPECT_EQ(DescribeEffect(Effect{}), "[]");
    EXPECT_EQ(DescribeEffect(Effect{{DismissMatchmaker{}, SaveCurrentTurn{"m-1", {1, 2, 3}}}, Ordering::Concurrent}),
              "[DismissMatchmaker,SaveCurrentTurn(m-1 3B)] concurrent");
    EXPECT_EQ(DescribeEffect(Effect{{ShowNotificationBanner{"Your turn", std::nullopt}}, Ordering::Sequential}),
              "[ShowNotificationBanner(\"Your turn\")]");
}

TEST(AuditLogger_File, WritesHeaderStepsAndEnd)
{
    std::filesystem::path const path = std::filesystem::temp_directory_path() / "wordcube-audit-unit.log";
    {
        AuditLogger audit(path.string());
        audit.start("p-me", 42);
        AppState state{};
        audit.step(AppAction{DidFinishLaunching{}}, state,
                   Effect{{AuthenticateLocalPlayer{}, StartListening{}}, Ordering::Sequential});
        audit.failure("SaveCurrentTurn", "service down");
        audit.end(state);
    }

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string const text = ss.str();

    EXPECT_NE(text.find("Player=p-me\nSeed=42\n"), std::string::npos);
    EXPECT_NE(text.find("Step 1 action=DidFinishLaunching\nScreen: Idle\nCommands: [Authenticate,StartListening]\n"),
              std::string::npos);
    EXPECT_NE(text.find("Failed: SaveCurrentTurn | service down"), std::string::npos);
    EXPECT_NE(text.find("End steps=1 screen=Idle"), std::string::npos);
}
