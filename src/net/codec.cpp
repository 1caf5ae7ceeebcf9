//
// codec.cpp
//
#include "codec.hpp"

#include <cstring>
#include <optional>
#include <type_traits>
#include <utility>

#include <flatbuffers/flatbuffers.h>

namespace fbn = wordcube::gen::net;

namespace wordcube::net
{
    auto ToFbStatus(core::MatchStatus s) noexcept -> fbn::MatchStatus
    {
        switch (s)
        {
        case core::MatchStatus::Unknown: return fbn::MatchStatus::Unknown;
        case core::MatchStatus::Open: return fbn::MatchStatus::Open;
        case core::MatchStatus::Ended: return fbn::MatchStatus::Ended;
        case core::MatchStatus::Matching: return fbn::MatchStatus::Matching;
        }
        return fbn::MatchStatus::Unknown;
    }

    auto FromFbStatus(fbn::MatchStatus s) noexcept -> core::MatchStatus
    {
        switch (s)
        {
        case fbn::MatchStatus::Unknown: return core::MatchStatus::Unknown;
        case fbn::MatchStatus::Open: return core::MatchStatus::Open;
        case fbn::MatchStatus::Ended: return core::MatchStatus::Ended;
        case fbn::MatchStatus::Matching: return core::MatchStatus::Matching;
        }
        return core::MatchStatus::Unknown;
    }

    auto ToFbOutcome(core::MatchOutcome o) noexcept -> fbn::MatchOutcome
    {
        switch (o)
        {
        case core::MatchOutcome::None: return fbn::MatchOutcome::None;
        case core::MatchOutcome::Quit: return fbn::MatchOutcome::Quit;
        case core::MatchOutcome::Won: return fbn::MatchOutcome::Won;
        case core::MatchOutcome::Lost: return fbn::MatchOutcome::Lost;
        case core::MatchOutcome::Tied: return fbn::MatchOutcome::Tied;
        case core::MatchOutcome::TimeExpired: return fbn::MatchOutcome::TimeExpired;
        }
        return fbn::MatchOutcome::None;
    }

    auto FromFbOutcome(fbn::MatchOutcome o) noexcept -> core::MatchOutcome
    {
        switch (o)
        {
        case fbn::MatchOutcome::None: return core::MatchOutcome::None;
        case fbn::MatchOutcome::Quit: return core::MatchOutcome::Quit;
        case fbn::MatchOutcome::Won: return core::MatchOutcome::Won;
        case fbn::MatchOutcome::Lost: return core::MatchOutcome::Lost;
        case fbn::MatchOutcome::Tied: return core::MatchOutcome::Tied;
        case fbn::MatchOutcome::TimeExpired: return core::MatchOutcome::TimeExpired;
        }
        return core::MatchOutcome::None;
    }
}

namespace
{
    using wordcube::net::ParseError;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)wordcube::core::MatchStatus::Ended == (int)fbn::MatchStatus::Ended);
    static_assert((int)wordcube::core::MatchOutcome::Quit == (int)fbn::MatchOutcome::Quit);

    auto Fail(std::string msg) -> std::unexpected<ParseError>
    {
        return std::unexpected(ParseError{std::move(msg)});
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Bytes(flatbuffers::Vector<std::uint8_t> const* v) -> std::vector<std::uint8_t>
    {
        if (!v) return {};
        return std::vector<std::uint8_t>(v->data(), v->data() + v->size());
    }

    auto BuildMatch(flatbuffers::FlatBufferBuilder& fbb, wordcube::core::TurnBasedMatch const& m)
        -> flatbuffers::Offset<fbn::Match>
    {
        std::vector<flatbuffers::Offset<fbn::Participant>> parts;
        parts.reserve(m.participants.size());
        for (wordcube::core::Participant const& p : m.participants)
        {
            flatbuffers::Offset<flatbuffers::String> pid{};
            if (p.player_id) pid = fbb.CreateString(*p.player_id);
            auto const name = fbb.CreateString(p.display_name);
            parts.push_back(fbn::CreateParticipant(fbb,
                                                   pid,
                                                   name,
                                                   wordcube::net::ToFbOutcome(p.outcome),
                                                   p.last_turn_date.has_value(),
                                                   p.last_turn_date ? wordcube::core::ToMillis(*p.last_turn_date) : 0));
        }
        auto const parts_vec = fbb.CreateVector(parts);
        auto const id = fbb.CreateString(m.match_id);
        auto const data = fbb.CreateVector(m.match_data);
        auto const msg = fbb.CreateString(m.message);

        return fbn::CreateMatch(fbb,
                                id,
                                parts_vec,
                                data,
                                wordcube::core::ToMillis(m.creation_date),
                                wordcube::net::ToFbStatus(m.status),
                                msg,
                                m.current_participant.has_value(),
                                m.current_participant.value_or(0));
    }

    auto ReadMatch(fbn::Match const* m) -> std::expected<wordcube::core::TurnBasedMatch, ParseError>
    {
        if (!m) return Fail("match missing");
        if (!m->match_id() || m->match_id()->size() == 0) return Fail("match without an id");

        wordcube::core::TurnBasedMatch out{};
        out.match_id = m->match_id()->str();
        if (auto const* parts = m->participants())
        {
            out.participants.reserve(parts->size());
            for (fbn::Participant const* p : *parts)
            {
                wordcube::core::Participant part{};
                if (p->player_id()) part.player_id = p->player_id()->str();
                part.display_name = Str(p->display_name());
                part.outcome = wordcube::net::FromFbOutcome(p->outcome());
                if (p->has_last_turn()) part.last_turn_date = wordcube::core::FromMillis(p->last_turn_ms());
                out.participants.push_back(std::move(part));
            }
        }
        out.match_data = Bytes(m->data());
        out.creation_date = wordcube::core::FromMillis(m->creation_ms());
        out.status = wordcube::net::FromFbStatus(m->status());
        out.message = Str(m->message());
        if (m->has_current())
        {
            if (m->current_idx() >= out.participants.size()) return Fail("current participant out of range");
            out.current_participant = m->current_idx();
        }
        return out;
    }

    auto ToEvent(fbn::EventKind kind, wordcube::core::TurnBasedMatch match, bool became_active)
        -> std::expected<wordcube::core::ListenerEvent, ParseError>
    {
        switch (kind)
        {
        case fbn::EventKind::MatchEnded:
            return wordcube::core::MatchEnded{std::move(match)};
        case fbn::EventKind::ReceivedTurn:
            return wordcube::core::ReceivedTurnEvent{std::move(match), became_active};
        case fbn::EventKind::WantsToQuit:
            return wordcube::core::WantsToQuitMatch{std::move(match)};
        }
        return Fail("unknown event kind");
    }

    auto EventParts(wordcube::core::ListenerEvent const& e)
        -> std::pair<fbn::EventKind, wordcube::core::TurnBasedMatch const*>
    {
        return std::visit(
            []<typename T0>(T0 const& ev) -> std::pair<fbn::EventKind, wordcube::core::TurnBasedMatch const*>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, wordcube::core::MatchEnded>)
                    return {fbn::EventKind::MatchEnded, &ev.match};
                else if constexpr (std::is_same_v<T, wordcube::core::ReceivedTurnEvent>)
                    return {fbn::EventKind::ReceivedTurn, &ev.match};
                else if constexpr (std::is_same_v<T, wordcube::core::WantsToQuitMatch>)
                    return {fbn::EventKind::WantsToQuit, &ev.match};
                else static_assert(sizeof(T) == 0, "Unhandled listener event");
            },
            e);
    }
} // anonymous

namespace wordcube::net
{
    auto EncodeEnvelope(Envelope const& env) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const body = std::visit(
            [&]<typename T0>(T0 const& m) -> std::pair<fbn::Body, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, HelloMsg>)
                {
                    auto const pid = fbb.CreateString(m.player_id);
                    auto const name = fbb.CreateString(m.display_name);
                    return {fbn::Body::Hello, fbn::CreateHello(fbb, pid, name).Union()};
                }
                else if constexpr (std::is_same_v<T, FindMatchMsg>)
                {
                    return {fbn::Body::FindMatchReq, fbn::CreateFindMatchReq(fbb, m.min_players).Union()};
                }
                else if constexpr (std::is_same_v<T, SaveTurnMsg>)
                {
                    auto const id = fbb.CreateString(m.match_id);
                    auto const data = fbb.CreateVector(m.data);
                    return {fbn::Body::SaveTurnReq, fbn::CreateSaveTurnReq(fbb, id, data).Union()};
                }
                else if constexpr (std::is_same_v<T, EndTurnMsg>)
                {
                    auto const id = fbb.CreateString(m.match_id);
                    auto const data = fbb.CreateVector(m.data);
                    auto const text = fbb.CreateString(m.message);
                    return {fbn::Body::EndTurnReq, fbn::CreateEndTurnReq(fbb, id, data, text).Union()};
                }
                else if constexpr (std::is_same_v<T, EndMatchMsg>)
                {
                    auto const id = fbb.CreateString(m.match_id);
                    auto const data = fbb.CreateVector(m.data);
                    auto const pid = fbb.CreateString(m.player_id);
                    auto const text = fbb.CreateString(m.message);
                    return {fbn::Body::EndMatchReq,
                            fbn::CreateEndMatchReq(fbb, id, data, pid, ToFbOutcome(m.outcome), text).Union()};
                }
                else if constexpr (std::is_same_v<T, RematchMsg>)
                {
                    auto const id = fbb.CreateString(m.match_id);
                    return {fbn::Body::RematchReq, fbn::CreateRematchReq(fbb, id).Union()};
                }
                else if constexpr (std::is_same_v<T, QuitMsg>)
                {
                    auto const id = fbb.CreateString(m.match_id);
                    return {fbn::Body::QuitReq, fbn::CreateQuitReq(fbb, id).Union()};
                }
                else if constexpr (std::is_same_v<T, HelloAckMsg>)
                {
                    auto const pid = fbb.CreateString(m.player.game_player_id);
                    auto const name = fbb.CreateString(m.player.display_name);
                    return {fbn::Body::HelloAck,
                            fbn::CreateHelloAck(fbb, pid, name, m.player.is_authenticated).Union()};
                }
                else if constexpr (std::is_same_v<T, AckMsg>)
                {
                    auto const err = fbb.CreateString(m.error);
                    return {fbn::Body::Ack, fbn::CreateAck(fbb, m.ok, err).Union()};
                }
                else if constexpr (std::is_same_v<T, MatchReplyMsg>)
                {
                    auto const match = BuildMatch(fbb, m.match);
                    return {fbn::Body::MatchReply, fbn::CreateMatchReply(fbb, match).Union()};
                }
                else if constexpr (std::is_same_v<T, MatchEventMsg>)
                {
                    auto const [kind, match] = EventParts(m.event);
                    bool const became_active = std::holds_alternative<core::ReceivedTurnEvent>(m.event) &&
                                               std::get<core::ReceivedTurnEvent>(m.event).did_become_active;
                    auto const match_off = BuildMatch(fbb, *match);
                    return {fbn::Body::MatchEvent,
                            fbn::CreateMatchEvent(fbb, kind, match_off, became_active).Union()};
                }
                else static_assert(sizeof(T) == 0, "Unhandled message body");
            },
            env.body);

        auto const root = fbn::CreateEnvelope(fbb, env.msg_id, body.first, body.second);
        fbn::FinishEnvelopeBuffer(fbb, root);

        std::vector<std::uint8_t> out(fbb.GetSize());
        std::memcpy(out.data(), fbb.GetBufferPointer(), fbb.GetSize());
        return out;
    }

    auto DecodeEnvelope(std::span<std::byte const> bytes) -> std::expected<Envelope, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");

        auto const* p = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(p, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return Fail("envelope failed verification");

        fbn::Envelope const* env = fbn::GetEnvelope(p);
        Envelope out{};
        out.msg_id = env->msg_id();

        switch (env->body_type())
        {
        case fbn::Body::Hello:
        {
            auto const* m = env->body_as_Hello();
            if (!m || !m->player_id() || m->player_id()->size() == 0) return Fail("hello without a player id");
            out.body = HelloMsg{m->player_id()->str(), Str(m->display_name())};
            return out;
        }
        case fbn::Body::FindMatchReq:
        {
            auto const* m = env->body_as_FindMatchReq();
            if (!m) return Fail("find match without a body");
            out.body = FindMatchMsg{m->min_players()};
            return out;
        }
        case fbn::Body::SaveTurnReq:
        {
            auto const* m = env->body_as_SaveTurnReq();
            if (!m || !m->match_id()) return Fail("save turn without a match id");
            out.body = SaveTurnMsg{m->match_id()->str(), Bytes(m->data())};
            return out;
        }
        case fbn::Body::EndTurnReq:
        {
            auto const* m = env->body_as_EndTurnReq();
            if (!m || !m->match_id()) return Fail("end turn without a match id");
            out.body = EndTurnMsg{m->match_id()->str(), Bytes(m->data()), Str(m->message())};
            return out;
        }
        case fbn::Body::EndMatchReq:
        {
            auto const* m = env->body_as_EndMatchReq();
            if (!m || !m->match_id()) return Fail("end match without a match id");
            out.body = EndMatchMsg{m->match_id()->str(), Bytes(m->data()), Str(m->player_id()),
                                   FromFbOutcome(m->outcome()), Str(m->message())};
            return out;
        }
        case fbn::Body::RematchReq:
        {
            auto const* m = env->body_as_RematchReq();
            if (!m || !m->match_id()) return Fail("rematch without a match id");
            out.body = RematchMsg{m->match_id()->str()};
            return out;
        }
        case fbn::Body::QuitReq:
        {
            auto const* m = env->body_as_QuitReq();
            if (!m || !m->match_id()) return Fail("quit without a match id");
            out.body = QuitMsg{m->match_id()->str()};
            return out;
        }
        case fbn::Body::HelloAck:
        {
            auto const* m = env->body_as_HelloAck();
            if (!m) return Fail("hello ack without a body");
            out.body = HelloAckMsg{core::LocalPlayer{Str(m->player_id()), Str(m->display_name()), m->authenticated()}};
            return out;
        }
        case fbn::Body::Ack:
        {
            auto const* m = env->body_as_Ack();
            if (!m) return Fail("ack without a body");
            out.body = AckMsg{m->ok(), Str(m->error())};
            return out;
        }
        case fbn::Body::MatchReply:
        {
            auto const* m = env->body_as_MatchReply();
            if (!m) return Fail("match reply without a body");
            auto match = ReadMatch(m->match());
            if (!match) return std::unexpected(std::move(match.error()));
            out.body = MatchReplyMsg{std::move(*match)};
            return out;
        }
        case fbn::Body::MatchEvent:
        {
            auto const* m = env->body_as_MatchEvent();
            if (!m) return Fail("match event without a body");
            auto match = ReadMatch(m->match());
            if (!match) return std::unexpected(std::move(match.error()));
            auto event = ToEvent(m->kind(), std::move(*match), m->became_active());
            if (!event) return std::unexpected(std::move(event.error()));
            out.body = MatchEventMsg{std::move(*event)};
            return out;
        }
        case fbn::Body::NONE:
            break;
        }
        return Fail("unknown message body");
    }
} // namespace wordcube::net
