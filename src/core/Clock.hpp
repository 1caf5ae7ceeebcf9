//
// Clock.hpp
//

#ifndef WORDCUBE_CLOCK_HPP
#define WORDCUBE_CLOCK_HPP

#include <atomic>
#include <chrono>
#include "Types.hpp"

namespace wordcube::core
{
    // Wall clock as seen by the reducers. Never read std::chrono::system_clock directly there.
    class GameClock
    {
    public:
        virtual ~GameClock() = default;

        virtual auto Now() const -> Timestamp = 0;
    };

    class SystemGameClock final : public GameClock
    {
    public:
        auto Now() const -> Timestamp override
        {
            return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
        }
    };

    // Stays where it is put.
    class FixedGameClock final : public GameClock
    {
    public:
        explicit FixedGameClock(Timestamp t) : now_ms_(ToMillis(t)) {}

        auto Now() const -> Timestamp override { return FromMillis(now_ms_.load()); }
        auto Set(Timestamp t) -> void { now_ms_.store(ToMillis(t)); }
        auto Advance(std::chrono::milliseconds d) -> void { now_ms_.fetch_add(d.count()); }

    private:
        std::atomic<int64_t> now_ms_;
    };
}

#endif //WORDCUBE_CLOCK_HPP
