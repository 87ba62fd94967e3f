#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <cstdint>
#include <random>

namespace handtris::core {

class TetrominoFactory {
public:
    // Seeded from std::random_device
    TetrominoFactory();

    // Deterministic sequence, for tests and replays
    explicit TetrominoFactory(std::uint32_t seed);

    PieceType randomType();

    // Random piece at rotation 0; the spawner positions it
    Tetromino createRandom();

private:
    std::mt19937 rng_;
};

} // namespace handtris::core
