//
// MatchServer.hpp - in-memory authoritative match service
//

#ifndef WORDCUBE_MATCHSERVER_HPP
#define WORDCUBE_MATCHSERVER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/Clock.hpp"
#include "../core/Match.hpp"
#include "../core/Types.hpp"
#include "codec.hpp"

namespace wordcube::net
{
    using ConnId = std::uint64_t;

    struct Outbound
    {
        ConnId to{};
        Envelope envelope{};
    };

    // Owns every match. Transport agnostic: a frame in, the frames to send out.
    // Replies echo the request msg_id; pushed events carry msg_id 0.
    class MatchServer
    {
    public:
        explicit MatchServer(core::GameClock const& clock);

        auto Disconnect(ConnId conn) -> void;
        auto Handle(ConnId from, Envelope const& in) -> std::vector<Outbound>;

        auto Find(core::MatchId const& match_id) const -> std::optional<core::TurnBasedMatch>;
        auto MatchCount() const -> std::size_t;

    private:
        struct Ctx
        {
            ConnId from;
            std::uint64_t msg_id;
            core::PlayerId player;
            std::vector<Outbound>& out;
        };

        auto OnHello(ConnId from, std::uint64_t msg_id, HelloMsg const& m, std::vector<Outbound>& out) -> void;
        auto OnFindMatch(Ctx& c, FindMatchMsg const& m) -> void;
        auto OnSaveTurn(Ctx& c, SaveTurnMsg const& m) -> void;
        auto OnEndTurn(Ctx& c, EndTurnMsg const& m) -> void;
        auto OnEndMatch(Ctx& c, EndMatchMsg const& m) -> void;
        auto OnRematch(Ctx& c, RematchMsg const& m) -> void;
        auto OnQuit(Ctx& c, QuitMsg const& m) -> void;

        // The match `player` holds the turn in, or an error reply.
        auto InTurn(Ctx& c, core::MatchId const& match_id) -> core::TurnBasedMatch*;

        auto Reply(Ctx& c, Body body) -> void;
        auto Fail(Ctx& c, std::string error) -> void;
        auto Push(std::vector<Outbound>& out, core::PlayerId const& to, core::ListenerEvent event) -> void;
        auto PushToOthers(std::vector<Outbound>& out, core::TurnBasedMatch const& match,
                          core::PlayerId const& except, bool ended) -> void;

        auto NewMatch(std::vector<core::Participant> participants) -> core::TurnBasedMatch&;

        core::GameClock const& clock_;
        mutable std::mutex mtx_;
        std::map<ConnId, core::PlayerId> players_;
        std::map<core::PlayerId, ConnId> conns_;
        std::map<core::PlayerId, std::string> names_;
        std::map<core::MatchId, core::TurnBasedMatch> matches_;
        std::uint64_t next_match_{1};
    };
}

#endif //WORDCUBE_MATCHSERVER_HPP
