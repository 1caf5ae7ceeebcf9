//
// Cubes.cpp
//
#include "Cubes.hpp"

#include <array>
#include "Exception.hpp"

namespace wordcube::core
{
    namespace
    {
        // English letter frequencies (per mille), A..Z
        constexpr std::array<int, 26> EnFrequencies{
            82, 15, 28, 43, 127, 22, 20, 61, 70, 2, 8, 40, 24,
            67, 75, 19, 1, 60, 63, 91, 28, 10, 24, 2, 20, 1
        };
    }

    RandomCubeGenerator::RandomCubeGenerator(uint64_t rng_seed):
        rng_(rng_seed),
        letters_(EnFrequencies.cbegin(), EnFrequencies.cend()) {}

    auto RandomCubeGenerator::DrawLetter() -> char
    {
        return static_cast<char>('A' + letters_(rng_));
    }

    auto RandomCubeGenerator::RandomCubes(Language language) -> Puzzle
    {
        WCB_ASSERT(language == Language::En, "Only English boards are supported");

        Puzzle p{};
        for (Cube& c : p)
        {
            c.left = CubeFace{DrawLetter(), CubeFaceSide::Left, 0};
            c.right = CubeFace{DrawLetter(), CubeFaceSide::Right, 0};
            c.top = CubeFace{DrawLetter(), CubeFaceSide::Top, 0};
            c.was_removed = false;
        }
        return p;
    }

    auto CubeIndex(size_t const x, size_t const y, size_t const z) -> uint8_t
    {
        WCB_ASSERT(x < constants::CubeAxis && y < constants::CubeAxis && z < constants::CubeAxis,
                   "Cube coordinate out of range");
        return static_cast<uint8_t>(x * constants::CubeAxis * constants::CubeAxis + y * constants::CubeAxis + z);
    }
}
