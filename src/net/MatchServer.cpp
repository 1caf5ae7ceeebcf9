//
// MatchServer.cpp
//
#include "MatchServer.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

#include "../core/Util.hpp"

namespace wordcube::net
{
    namespace
    {
        // What everyone still playing gets when one player's outcome is decided.
        auto OpponentOutcome(core::MatchOutcome o) -> core::MatchOutcome
        {
            switch (o)
            {
            case core::MatchOutcome::Won: return core::MatchOutcome::Lost;
            case core::MatchOutcome::Tied: return core::MatchOutcome::Tied;
            case core::MatchOutcome::None:
            case core::MatchOutcome::Quit:
            case core::MatchOutcome::Lost:
            case core::MatchOutcome::TimeExpired: return core::MatchOutcome::Won;
            }
            return core::MatchOutcome::Won;
        }

        auto SeatOf(core::TurnBasedMatch const& m, core::PlayerId const& id) -> std::optional<core::PlyrIdxT>
        {
            return m.IndexOf(id);
        }
    }

    MatchServer::MatchServer(core::GameClock const& clock)
        : clock_{clock}
    {
    }

    auto MatchServer::Disconnect(ConnId conn) -> void
    {
        std::lock_guard lock(mtx_);
        auto it = players_.find(conn);
        if (it == players_.end()) return;
        if (auto c = conns_.find(it->second); c != conns_.end() && c->second == conn) conns_.erase(c);
        std::print("[Server] {} disconnected\n", it->second);
        players_.erase(it);
    }

    auto MatchServer::Find(core::MatchId const& match_id) const -> std::optional<core::TurnBasedMatch>
    {
        std::lock_guard lock(mtx_);
        if (auto it = matches_.find(match_id); it != matches_.end()) return it->second;
        return std::nullopt;
    }

    auto MatchServer::MatchCount() const -> std::size_t
    {
        std::lock_guard lock(mtx_);
        return matches_.size();
    }

    auto MatchServer::Handle(ConnId from, Envelope const& in) -> std::vector<Outbound>
    {
        std::lock_guard lock(mtx_);
        std::vector<Outbound> out;

        if (auto const* hello = std::get_if<HelloMsg>(&in.body))
        {
            OnHello(from, in.msg_id, *hello, out);
            return out;
        }

        auto who = players_.find(from);
        if (who == players_.end())
        {
            out.push_back(Outbound{from, Envelope{in.msg_id, AckMsg{false, "Say hello first"}}});
            return out;
        }

        Ctx c{from, in.msg_id, who->second, out};
        std::visit(
            core::util::Overloaded{
                [&](FindMatchMsg const& m) { OnFindMatch(c, m); },
                [&](SaveTurnMsg const& m) { OnSaveTurn(c, m); },
                [&](EndTurnMsg const& m) { OnEndTurn(c, m); },
                [&](EndMatchMsg const& m) { OnEndMatch(c, m); },
                [&](RematchMsg const& m) { OnRematch(c, m); },
                [&](QuitMsg const& m) { OnQuit(c, m); },
                [&](HelloMsg const&) {},
                // server -> client messages are not requests
                [&](HelloAckMsg const&) { Fail(c, "Unexpected message"); },
                [&](AckMsg const&) { Fail(c, "Unexpected message"); },
                [&](MatchReplyMsg const&) { Fail(c, "Unexpected message"); },
                [&](MatchEventMsg const&) { Fail(c, "Unexpected message"); },
            },
            in.body);
        return out;
    }

    auto MatchServer::OnHello(ConnId from, std::uint64_t msg_id, HelloMsg const& m, std::vector<Outbound>& out)
        -> void
    {
        if (m.player_id.empty())
        {
            out.push_back(Outbound{from, Envelope{msg_id, AckMsg{false, "Player id required"}}});
            return;
        }

        // a new connection takes the player over
        if (auto old = conns_.find(m.player_id); old != conns_.end()) players_.erase(old->second);
        players_[from] = m.player_id;
        conns_[m.player_id] = from;
        std::string const name = m.display_name.empty() ? m.player_id : m.display_name;
        names_[m.player_id] = name;

        std::print("[Server] {} ({}) authenticated\n", name, m.player_id);
        out.push_back(Outbound{from, Envelope{msg_id, HelloAckMsg{core::LocalPlayer{m.player_id, name, true}}}});
    }

    auto MatchServer::OnFindMatch(Ctx& c, FindMatchMsg const& m) -> void
    {
        // join the oldest match with a free seat
        for (auto& [id, match] : matches_)
        {
            if (match.status != core::MatchStatus::Matching || SeatOf(match, c.player)) continue;

            auto seat = std::ranges::find_if(match.participants,
                                             [](core::Participant const& p) { return !p.player_id; });
            if (seat == match.participants.end()) continue;

            seat->player_id = c.player;
            seat->display_name = names_[c.player];
            bool const full = std::ranges::none_of(match.participants,
                                                   [](core::Participant const& p) { return !p.player_id; });
            if (full) match.status = core::MatchStatus::Open;

            std::print("[Server] {} joined {}\n", c.player, id);
            Reply(c, AckMsg{true, {}});
            Push(c.out, c.player, core::ReceivedTurnEvent{match, true});
            return;
        }

        std::uint8_t const seats = std::max<std::uint8_t>(m.min_players, 2);
        std::vector<core::Participant> participants(seats);
        participants[0].player_id = c.player;
        participants[0].display_name = names_[c.player];

        core::TurnBasedMatch& match = NewMatch(std::move(participants));
        match.status = core::MatchStatus::Matching;
        match.current_participant = 0;

        std::print("[Server] {} created {} ({} seats)\n", c.player, match.match_id, static_cast<int>(seats));
        Reply(c, AckMsg{true, {}});
        Push(c.out, c.player, core::ReceivedTurnEvent{match, true});
    }

    auto MatchServer::OnSaveTurn(Ctx& c, SaveTurnMsg const& m) -> void
    {
        core::TurnBasedMatch* match = InTurn(c, m.match_id);
        if (!match) return;
        match->match_data = m.data;
        Reply(c, AckMsg{true, {}});
    }

    auto MatchServer::OnEndTurn(Ctx& c, EndTurnMsg const& m) -> void
    {
        core::TurnBasedMatch* match = InTurn(c, m.match_id);
        if (!match) return;

        core::PlyrIdxT const seat = *match->current_participant;
        match->match_data = m.data;
        match->message = m.message;
        match->participants[seat].last_turn_date = clock_.Now();

        // next seat still playing
        std::size_t const n = match->participants.size();
        for (std::size_t step = 1; step <= n; ++step)
        {
            auto const next = static_cast<core::PlyrIdxT>((seat + step) % n);
            if (match->participants[next].outcome == core::MatchOutcome::None)
            {
                match->current_participant = next;
                break;
            }
        }

        std::print("[Server] {} ended a turn in {}\n", c.player, match->match_id);
        Reply(c, AckMsg{true, {}});
        PushToOthers(c.out, *match, c.player, false);
    }

    auto MatchServer::OnEndMatch(Ctx& c, EndMatchMsg const& m) -> void
    {
        core::TurnBasedMatch* match = InTurn(c, m.match_id);
        if (!match) return;

        core::PlayerId const& decided = m.player_id.empty() ? c.player : m.player_id;
        std::optional<core::PlyrIdxT> const seat = SeatOf(*match, decided);
        if (!seat)
        {
            Fail(c, std::format("{} is not in {}", decided, m.match_id));
            return;
        }

        core::Timestamp const now = clock_.Now();
        match->match_data = m.data;
        match->message = m.message;
        match->participants[*seat].outcome = m.outcome;
        match->participants[*seat].last_turn_date = now;
        for (core::Participant& p : match->participants)
        {
            if (p.outcome == core::MatchOutcome::None) p.outcome = OpponentOutcome(m.outcome);
        }
        match->status = core::MatchStatus::Ended;
        match->current_participant.reset();

        std::print("[Server] {} ended: {}\n", match->match_id, m.message);
        Reply(c, AckMsg{true, {}});
        PushToOthers(c.out, *match, c.player, true);
    }

    auto MatchServer::OnRematch(Ctx& c, RematchMsg const& m) -> void
    {
        auto it = matches_.find(m.match_id);
        if (it == matches_.end() || !SeatOf(it->second, c.player))
        {
            Fail(c, std::format("No match {} for {}", m.match_id, c.player));
            return;
        }

        // requester first, then everyone else in their old order
        std::vector<core::Participant> participants;
        participants.push_back(core::Participant{c.player, names_[c.player]});
        for (core::Participant const& p : it->second.participants)
        {
            if (p.player_id && *p.player_id != c.player)
            {
                participants.push_back(core::Participant{p.player_id, p.display_name});
            }
        }
        bool const full = participants.size() == it->second.participants.size();
        participants.resize(it->second.participants.size());

        core::TurnBasedMatch& match = NewMatch(std::move(participants));
        match.status = full ? core::MatchStatus::Open : core::MatchStatus::Matching;
        match.current_participant = 0;

        std::print("[Server] {} requested a rematch of {}: {}\n", c.player, m.match_id, match.match_id);
        Reply(c, MatchReplyMsg{match});
    }

    auto MatchServer::OnQuit(Ctx& c, QuitMsg const& m) -> void
    {
        auto it = matches_.find(m.match_id);
        std::optional<core::PlyrIdxT> const seat = it == matches_.end() ? std::nullopt : SeatOf(it->second, c.player);
        if (!seat)
        {
            Fail(c, std::format("No match {} for {}", m.match_id, c.player));
            return;
        }
        core::TurnBasedMatch& match = it->second;
        if (match.IsOver())
        {
            Fail(c, std::format("{} is over", m.match_id));
            return;
        }

        Reply(c, AckMsg{true, {}});

        // in turn: the client ends the match itself
        if (match.current_participant == seat)
        {
            Push(c.out, c.player, core::WantsToQuitMatch{match});
            return;
        }

        match.participants[*seat].outcome = core::MatchOutcome::Quit;
        auto const still_playing = std::ranges::count_if(
            match.participants,
            [](core::Participant const& p) { return p.player_id && p.outcome == core::MatchOutcome::None; });
        if (still_playing <= 1)
        {
            for (core::Participant& p : match.participants)
            {
                if (p.outcome == core::MatchOutcome::None) p.outcome = core::MatchOutcome::Won;
            }
            match.status = core::MatchStatus::Ended;
            match.current_participant.reset();
            PushToOthers(c.out, match, c.player, true);
        }
        std::print("[Server] {} quit {} out of turn\n", c.player, m.match_id);
    }

    auto MatchServer::InTurn(Ctx& c, core::MatchId const& match_id) -> core::TurnBasedMatch*
    {
        auto it = matches_.find(match_id);
        if (it == matches_.end())
        {
            Fail(c, std::format("No match {}", match_id));
            return nullptr;
        }
        core::Participant const* current = it->second.CurrentParticipant();
        if (it->second.status == core::MatchStatus::Ended || !current || current->player_id != c.player)
        {
            Fail(c, std::format("Not {}'s turn in {}", c.player, match_id));
            return nullptr;
        }
        return &it->second;
    }

    auto MatchServer::Reply(Ctx& c, Body body) -> void
    {
        c.out.push_back(Outbound{c.from, Envelope{c.msg_id, std::move(body)}});
    }

    auto MatchServer::Fail(Ctx& c, std::string error) -> void
    {
        std::print("[Server] Refused request from {}: {}\n", c.player, error);
        Reply(c, AckMsg{false, std::move(error)});
    }

    auto MatchServer::Push(std::vector<Outbound>& out, core::PlayerId const& to, core::ListenerEvent event) -> void
    {
        auto it = conns_.find(to);
        if (it == conns_.end()) return;
        out.push_back(Outbound{it->second, Envelope{0, MatchEventMsg{std::move(event)}}});
    }

    auto MatchServer::PushToOthers(std::vector<Outbound>& out,
                                   core::TurnBasedMatch const& match,
                                   core::PlayerId const& except,
                                   bool ended) -> void
    {
        for (core::Participant const& p : match.participants)
        {
            if (!p.player_id || *p.player_id == except) continue;
            if (ended) Push(out, *p.player_id, core::MatchEnded{match});
            else Push(out, *p.player_id, core::ReceivedTurnEvent{match, false});
        }
    }

    auto MatchServer::NewMatch(std::vector<core::Participant> participants) -> core::TurnBasedMatch&
    {
        core::TurnBasedMatch match{};
        match.match_id = std::format("m-{}", next_match_++);
        match.participants = std::move(participants);
        match.creation_date = clock_.Now();
        core::MatchId const id = match.match_id;
        return matches_.emplace(id, std::move(match)).first->second;
    }
}
