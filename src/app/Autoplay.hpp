//
// Autoplay.hpp
//

#ifndef WORDCUBE_AUTOPLAY_HPP
#define WORDCUBE_AUTOPLAY_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "../core/State.hpp"
#include "../core/Types.hpp"
#include "../net/MatchServiceClient.hpp"

namespace wordcube::app
{
    enum class AutoplayMode : uint8_t
    {
        Off = 0,
        EndTurn,
        Quit
    };

    // Drives the shown turn based match for the headless client.
    // EndTurn passes every turn handed to the local player; Quit leaves each shown match once.
    class Autoplay
    {
    public:
        Autoplay(net::MatchServiceClient& client, AutoplayMode mode);

        // Acts at most once per distinct turn state. Returns true when a request went out.
        // throws error::ServiceError from the client
        auto Tick(core::Destination const& shown) -> bool;

    private:
        net::MatchServiceClient& client_;
        AutoplayMode mode_;
        std::set<std::pair<core::MatchId, std::int64_t>> acted_;
    };
}

#endif //WORDCUBE_AUTOPLAY_HPP
