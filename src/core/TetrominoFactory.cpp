#include "core/TetrominoFactory.hpp"
#include <random>

namespace handtris::core {

TetrominoFactory::TetrominoFactory()
    : rng_{std::random_device{}()}
{
}

TetrominoFactory::TetrominoFactory(std::uint32_t seed)
    : rng_{seed}
{
}

PieceType TetrominoFactory::randomType() {
    std::uniform_int_distribution<int> dist(0, PieceTypeCount - 1);
    return static_cast<PieceType>(dist(rng_));
}

Tetromino TetrominoFactory::createRandom() {
    return Tetromino{randomType()};
}

} // namespace handtris::core
