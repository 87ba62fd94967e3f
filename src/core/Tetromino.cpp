#include "core/Tetromino.hpp"

#include <cstddef>
#include <initializer_list>

namespace handtris::core {

namespace {

ShapeMatrix makeShape(std::initializer_list<std::initializer_list<std::uint8_t>> rows) {
    ShapeMatrix m{};
    m.size = static_cast<int>(rows.size());
    int r = 0;
    for (const auto& row : rows) {
        int c = 0;
        for (std::uint8_t v : row) {
            m.cells[r][c++] = v;
        }
        ++r;
    }
    return m;
}

// Indexed by PieceType ordinal
const std::array<ShapeMatrix, PieceTypeCount>& shapeTable() {
    static const std::array<ShapeMatrix, PieceTypeCount> table{
        // I
        makeShape({
            {0, 0, 0, 0},
            {1, 1, 1, 1},
            {0, 0, 0, 0},
            {0, 0, 0, 0}
        }),
        // J
        makeShape({
            {1, 0, 0},
            {1, 1, 1},
            {0, 0, 0}
        }),
        // L
        makeShape({
            {0, 0, 1},
            {1, 1, 1},
            {0, 0, 0}
        }),
        // O
        makeShape({
            {0, 0, 0},
            {0, 1, 1},
            {0, 1, 1}
        }),
        // S
        makeShape({
            {0, 1, 1},
            {1, 1, 0},
            {0, 0, 0}
        }),
        // T
        makeShape({
            {0, 1, 0},
            {1, 1, 1},
            {0, 0, 0}
        }),
        // Z
        makeShape({
            {1, 1, 0},
            {0, 1, 1},
            {0, 0, 0}
        })
    };
    return table;
}

} // namespace

ShapeMatrix ShapeMatrix::rotatedClockwise() const noexcept {
    ShapeMatrix result{};
    result.size = size;
    const int n = size;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            result.cells[j][n - 1 - i] = cells[i][j];
        }
    }
    return result;
}

Tetromino::Tetromino(PieceType type)
    : Tetromino(type, Rotation::R0, 0, 0)
{
}

Tetromino::Tetromino(PieceType type, Rotation rotation, int x, int y)
    : type_{type}, rotation_{rotation}, x_{x}, y_{y}
{
}

void Tetromino::setPosition(int x, int y) noexcept {
    x_ = x;
    y_ = y;
}

void Tetromino::rotateClockwise() noexcept {
    rotation_ = nextRotation(rotation_);
}

ShapeMatrix Tetromino::shape() const noexcept {
    ShapeMatrix m = baseShape(type_);
    const int turns = static_cast<int>(rotation_);
    for (int t = 0; t < turns; ++t) {
        m = m.rotatedClockwise();
    }
    return m;
}

Tetromino::Blocks Tetromino::blocks() const noexcept {
    const ShapeMatrix m = shape();
    Blocks out{};
    int k = 0;
    for (int i = 0; i < m.size; ++i) {
        for (int j = 0; j < m.size; ++j) {
            if (m.filled(i, j) && k < BlockCount) {
                out[k++] = Position{y_ + i, x_ + j};
            }
        }
    }
    return out;
}

const ShapeMatrix& Tetromino::baseShape(PieceType type) noexcept {
    return shapeTable()[static_cast<std::size_t>(type)];
}

} // namespace handtris::core
