#include "core/GameSnapshot.hpp"
#include "core/Tetromino.hpp"

#include <cstddef>

namespace handtris::core {

std::optional<std::string> validateSnapshot(const GameSnapshot& snapshot, int rows, int cols)
{
    if (snapshot.rows != rows || snapshot.cols != cols) {
        return "grid is " + std::to_string(snapshot.rows) + "x" + std::to_string(snapshot.cols)
             + ", expected " + std::to_string(rows) + "x" + std::to_string(cols);
    }

    const auto expected = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
    if (snapshot.cells.size() != expected) {
        return "grid has " + std::to_string(snapshot.cells.size()) + " cells, expected "
             + std::to_string(expected);
    }

    for (std::size_t i = 0; i < snapshot.cells.size(); ++i) {
        const Color c = snapshot.cells[i];
        if (c != EmptyCell && !isPieceColor(c)) {
            return "unknown color in cell " + std::to_string(i);
        }
    }

    // Enum values may come from an unchecked cast of a persisted ordinal
    if (static_cast<int>(snapshot.nextPieceType) >= PieceTypeCount) {
        return "unknown next piece type";
    }

    if (snapshot.currentPiece) {
        const auto& p = *snapshot.currentPiece;
        if (static_cast<int>(p.type) >= PieceTypeCount) {
            return "unknown current piece type";
        }
        if (p.rotation < 0 || p.rotation > 3) {
            return "rotation out of range";
        }

        // Coarse range first so blocks() cannot overflow
        const int margin = ShapeMatrix::MaxSize;
        if (p.x < -margin || p.x > cols || p.y < -margin || p.y > rows) {
            return "current piece position out of range";
        }

        // Rows above the top are allowed, as for a moving piece
        const Tetromino piece{p.type, static_cast<Rotation>(p.rotation), p.x, p.y};
        for (const auto& b : piece.blocks()) {
            if (b.col < 0 || b.col >= cols || b.row >= rows) {
                return "current piece outside the board";
            }
        }
    }

    return std::nullopt;
}

} // namespace handtris::core
