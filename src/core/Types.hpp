//
// Types.hpp
//

#ifndef WORDCUBE_TYPES_HPP
#define WORDCUBE_TYPES_HPP

#define WCB_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace wordcube::core::constants
{
    inline constexpr size_t CubeAxis = 3;
    inline constexpr size_t CubeCount = CubeAxis * CubeAxis * CubeAxis;
    inline constexpr size_t FacesPerCube = 3;
    // A face is worn out after this many uses; a cube is removed once all faces are.
    inline constexpr uint8_t MaxFaceUses = 3;
    inline constexpr std::chrono::seconds RecentTurnWindow{60};
}

namespace wordcube::core
{
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
    using MatchId = std::string;
    using PlayerId = std::string;
    using PlyrIdxT = uint8_t;

    inline auto ToMillis(Timestamp const t) noexcept -> int64_t
    {
        return t.time_since_epoch().count();
    }

    inline auto FromMillis(int64_t const ms) noexcept -> Timestamp
    {
        return Timestamp{std::chrono::milliseconds{ms}};
    }

    enum class GameMode : uint8_t
    {
        Timed = 0,
        Unlimited
    };

    enum class Language : uint8_t
    {
        En = 0
    };

    enum class CubeFaceSide : uint8_t
    {
        Top = 0,
        Left,
        Right
    };

    struct CubeFace
    {
        char letter{'A'};
        CubeFaceSide side{CubeFaceSide::Top};
        uint8_t use_count{0};
    };
    inline auto operator==(CubeFace const& a, CubeFace const& b) -> bool
    {
        return a.letter == b.letter && a.side == b.side && a.use_count == b.use_count;
    }

    struct Cube
    {
        CubeFace left{'A', CubeFaceSide::Left};
        CubeFace right{'A', CubeFaceSide::Right};
        CubeFace top{'A', CubeFaceSide::Top};
        bool was_removed{false};
    };
    inline auto operator==(Cube const& a, Cube const& b) -> bool
    {
        return a.left == b.left && a.right == b.right && a.top == b.top && a.was_removed == b.was_removed;
    }

    // index = x * 9 + y * 3 + z
    using Puzzle = std::array<Cube, constants::CubeCount>;

    struct IndexedCubeFace
    {
        uint8_t index{};
        CubeFaceSide side{};
    };
    inline auto operator==(IndexedCubeFace const& a, IndexedCubeFace const& b) -> bool
    {
        return a.index == b.index && a.side == b.side;
    }

    struct PlayedWord
    {
        std::vector<IndexedCubeFace> faces;
    };
    inline auto operator==(PlayedWord const& a, PlayedWord const& b) -> bool { return a.faces == b.faces; }

    struct RemovedCube
    {
        uint8_t index{};
    };
    inline auto operator==(RemovedCube const& a, RemovedCube const& b) -> bool { return a.index == b.index; }

    using MoveType = std::variant<PlayedWord, RemovedCube>;

    struct Move
    {
        Timestamp played_at{};
        std::optional<PlyrIdxT> player_index{};
        int32_t score{0};
        MoveType type{PlayedWord{}};
    };
    inline auto operator==(Move const& a, Move const& b) -> bool
    {
        return a.played_at == b.played_at && a.player_index == b.player_index &&
               a.score == b.score && a.type == b.type;
    }

    // Process-wide settings shared by the client and server binaries.
    struct Config
    {
        uint64_t seed{std::random_device{}()};
        Language language{Language::En};
        std::chrono::seconds recent_turn_window{constants::RecentTurnWindow};
        std::filesystem::path games_dir{"games"};
        // empty = no audit transcript
        std::filesystem::path audit_log{};
    };
}

#endif //WORDCUBE_TYPES_HPP
