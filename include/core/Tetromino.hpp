#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, PieceType, Color
#include <array> // For std::array

// Namespace for handtris core types
namespace handtris::core {

// Square occupancy matrix of a piece (3x3 or 4x4, stored in a 4x4 array)
struct ShapeMatrix {
    static constexpr int MaxSize = 4;

    int size{0};
    std::array<std::array<std::uint8_t, MaxSize>, MaxSize> cells{};

    bool filled(int row, int col) const noexcept { return cells[row][col] != 0; }

    // Clockwise quarter turn: result[j][n-1-i] = source[i][j]
    ShapeMatrix rotatedClockwise() const noexcept;

    bool operator==(const ShapeMatrix& other) const noexcept {
        return size == other.size && cells == other.cells;
    }
    bool operator!=(const ShapeMatrix& other) const noexcept { return !(*this == other); }
};

// Represents a falling piece.
// x/y is the top-left corner of the shape's bounding box in grid coordinates
// (x = column, y = row). Moves are unconditional; legality is the caller's job.
class Tetromino {
public:
    static constexpr int BlockCount = 4;

    using Blocks = std::array<Position, BlockCount>;

    explicit Tetromino(PieceType type);
    Tetromino(PieceType type, Rotation rotation, int x, int y);

    PieceType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    int x() const noexcept { return x_; }
    int y() const noexcept { return y_; }
    Color color() const noexcept { return colorFor(type_); }

    void setPosition(int x, int y) noexcept;
    void setRotation(Rotation r) noexcept { rotation_ = r; }

    void moveLeft() noexcept  { --x_; }
    void moveRight() noexcept { ++x_; }
    void moveDown() noexcept  { ++y_; }
    void rotateClockwise() noexcept;

    // Spawn shape rotated `rotation()` times; derived on every call
    ShapeMatrix shape() const noexcept;

    // Positions of the 4 filled cells in board coordinates
    Blocks blocks() const noexcept;

    // Spawn-orientation shape of a type
    static const ShapeMatrix& baseShape(PieceType type) noexcept;

    bool operator==(const Tetromino& other) const noexcept {
        return type_ == other.type_ && rotation_ == other.rotation_
            && x_ == other.x_ && y_ == other.y_;
    }
    bool operator!=(const Tetromino& other) const noexcept { return !(*this == other); }

private:
    PieceType type_;
    Rotation rotation_;
    int x_;
    int y_;
};

} // namespace handtris::core
