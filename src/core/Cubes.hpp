//
// Cubes.hpp
//

#ifndef WORDCUBE_CUBES_HPP
#define WORDCUBE_CUBES_HPP

#include <random>
#include "Types.hpp"

namespace wordcube::core
{
    // Source of fresh boards. Injected wherever a new game is dealt so tests can fix the board.
    class CubeGenerator
    {
    public:
        virtual ~CubeGenerator() = default;

        virtual auto RandomCubes(Language language) -> Puzzle = 0;
    };

    // Letters drawn from a frequency table, one independent draw per face.
    class RandomCubeGenerator final : public CubeGenerator
    {
    public:
        explicit RandomCubeGenerator(uint64_t rng_seed);

        auto RandomCubes(Language language) -> Puzzle override;

    private:
        auto DrawLetter() -> char;

    private:
        std::mt19937_64 rng_;
        std::discrete_distribution<int> letters_;
    };

    // Always deals the same board.
    class FixedCubeGenerator final : public CubeGenerator
    {
    public:
        explicit FixedCubeGenerator(Puzzle cubes) : cubes_(cubes) {}

        auto RandomCubes(Language) -> Puzzle override { return cubes_; }

    private:
        Puzzle cubes_;
    };

    auto CubeIndex(size_t x, size_t y, size_t z) -> uint8_t;
}

#endif //WORDCUBE_CUBES_HPP
