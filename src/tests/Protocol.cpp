#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <variant>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Match.hpp"
#include "../core/Util.hpp"
#include "../net/codec.hpp"

#include "Fixtures.hpp"

using namespace wordcube::core;
using namespace wordcube::net;
using namespace wordcube::test;

namespace
{
    auto Pass(Envelope const& env) -> std::expected<Envelope, ParseError>
    {
        std::vector<std::uint8_t> const bytes = EncodeEnvelope(env);
        return DecodeEnvelope(util::AsBytes(bytes));
    }

    auto FullMatch() -> TurnBasedMatch
    {
        TurnBasedMatch m = MakeMatch("m-4", 1, SampleBytes());
        m.participants[0].outcome = MatchOutcome::None;
        m.participants[1].last_turn_date = T0() - std::chrono::seconds(5);
        m.status = MatchStatus::Matching;
        return m;
    }
}

TEST(Protocol, HelloKeepsIdentityAndMsgId)
{
    std::expected<Envelope, ParseError> const back = Pass(Envelope{42, HelloMsg{"p-me", "Blob"}});
    ASSERT_TRUE(back.has_value()) << back.error().message;
    EXPECT_EQ(back->msg_id, 42u);

    HelloMsg const* hello = std::get_if<HelloMsg>(&back->body);
    ASSERT_NE(hello, nullptr);
    EXPECT_EQ(hello->player_id, "p-me");
    EXPECT_EQ(hello->display_name, "Blob");
}

TEST(Protocol, EndMatchCarriesOutcomeAndData)
{
    EndMatchMsg msg{"m-1", {1, 2, 3}, "p-me", MatchOutcome::Quit, "Blob forfeited the match."};
    std::expected<Envelope, ParseError> const back = Pass(Envelope{3, msg});
    ASSERT_TRUE(back.has_value());

    EndMatchMsg const* end = std::get_if<EndMatchMsg>(&back->body);
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->match_id, "m-1");
    EXPECT_EQ(end->data, (std::vector<std::uint8_t>{1, 2, 3}));
    EXPECT_EQ(end->player_id, "p-me");
    EXPECT_EQ(end->outcome, MatchOutcome::Quit);
    EXPECT_EQ(end->message, msg.message);
}

TEST(Protocol, MatchSnapshotSurvivesTheWire)
{
    TurnBasedMatch const match = FullMatch();
    std::expected<Envelope, ParseError> const back = Pass(Envelope{9, MatchReplyMsg{match}});
    ASSERT_TRUE(back.has_value());

    MatchReplyMsg const* reply = std::get_if<MatchReplyMsg>(&back->body);
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->match, match);
}

TEST(Protocol, UnseatedParticipantAndNoCurrent)
{
    TurnBasedMatch match = FullMatch();
    match.participants[1].player_id.reset();
    match.current_participant.reset();

    std::expected<Envelope, ParseError> const back = Pass(Envelope{1, MatchReplyMsg{match}});
    ASSERT_TRUE(back.has_value());
    TurnBasedMatch const& got = std::get<MatchReplyMsg>(back->body).match;
    EXPECT_FALSE(got.participants[1].player_id.has_value());
    EXPECT_FALSE(got.current_participant.has_value());
}

TEST(Protocol, PushedEventsKeepTheirKind)
{
    TurnBasedMatch const match = FullMatch();
    std::vector<ListenerEvent> const events{
        MatchEnded{match}, ReceivedTurnEvent{match, true}, ReceivedTurnEvent{match, false}, WantsToQuitMatch{match}};

    for (ListenerEvent const& e : events)
    {
        std::expected<Envelope, ParseError> const back = Pass(Envelope{0, MatchEventMsg{e}});
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(back->msg_id, 0u);

        MatchEventMsg const* ev = std::get_if<MatchEventMsg>(&back->body);
        ASSERT_NE(ev, nullptr);
        EXPECT_EQ(ev->event.index(), e.index());
        if (ReceivedTurnEvent const* turn = std::get_if<ReceivedTurnEvent>(&e))
        {
            EXPECT_EQ(std::get<ReceivedTurnEvent>(ev->event).did_become_active, turn->did_become_active);
        }
    }
}

TEST(Protocol, NegativeAckKeepsReason)
{
    std::expected<Envelope, ParseError> const back = Pass(Envelope{5, AckMsg{false, "Not your turn"}});
    ASSERT_TRUE(back.has_value());
    AckMsg const* ack = std::get_if<AckMsg>(&back->body);
    ASSERT_NE(ack, nullptr);
    EXPECT_FALSE(ack->ok);
    EXPECT_EQ(ack->error, "Not your turn");
}

TEST(Protocol, RejectsJunkAndShortFrames)
{
    std::vector<std::uint8_t> const junk{0x10, 0x00, 0x00, 0x00, 'X', 'X', 'X', 'X', 0xff, 0xff, 0xff, 0xff};
    EXPECT_FALSE(DecodeEnvelope(util::AsBytes(junk)).has_value());

    std::vector<std::uint8_t> const tiny{0x01};
    EXPECT_FALSE(DecodeEnvelope(util::AsBytes(tiny)).has_value());
}

TEST(Protocol, RejectsMatchWithoutId)
{
    TurnBasedMatch match = FullMatch();
    match.match_id.clear();
    std::expected<Envelope, ParseError> const back = Pass(Envelope{1, MatchReplyMsg{match}});
    ASSERT_FALSE(back.has_value());
    EXPECT_EQ(back.error().message, "match without an id");
}

TEST(Protocol, RejectsCurrentSeatOutOfRange)
{
    TurnBasedMatch match = FullMatch();
    match.current_participant = 7;
    EXPECT_FALSE(Pass(Envelope{1, MatchReplyMsg{match}}).has_value());
}

TEST(Protocol, RejectsHelloWithoutPlayer)
{
    EXPECT_FALSE(Pass(Envelope{1, HelloMsg{"", "nobody"}}).has_value());
}

TEST(Protocol, EnumMappingIsTotal)
{
    for (MatchStatus s : {MatchStatus::Unknown, MatchStatus::Open, MatchStatus::Ended, MatchStatus::Matching})
    {
        EXPECT_EQ(FromFbStatus(ToFbStatus(s)), s);
    }
    for (MatchOutcome o : {MatchOutcome::None, MatchOutcome::Quit, MatchOutcome::Won, MatchOutcome::Lost,
                           MatchOutcome::Tied, MatchOutcome::TimeExpired})
    {
        EXPECT_EQ(FromFbOutcome(ToFbOutcome(o)), o);
    }
}
