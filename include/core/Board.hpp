#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <vector>

namespace handtris::core {

// Occupancy grid. Every cell is EmptyCell or the lock color of a piece type.
class Board {
public:
    static constexpr int DefaultRows = 20;
    static constexpr int DefaultCols = 10;

    Board(int rows = DefaultRows, int cols = DefaultCols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    Color cell(int row, int col) const;
    bool isEmpty(int row, int col) const { return cell(row, col) == EmptyCell; }

    // Throws std::invalid_argument for a value that is neither empty nor a piece color
    void setCell(int row, int col, Color color);

    // Row-major copy of the grid, rows() * cols() entries
    const std::vector<Color>& cells() const noexcept { return grid_; }

    // Replace the whole grid; throws std::invalid_argument on size mismatch
    void assign(const std::vector<Color>& cells);

    void clear() noexcept;

    // False if any filled cell of the shifted shape leaves [0, cols) horizontally,
    // reaches row >= rows(), or lands on an occupied cell at row >= 0.
    // Rows above the board are only checked horizontally.
    bool canMove(const Tetromino& tetromino, int dx, int dy) const noexcept;

    bool isCollision(const Tetromino& tetromino) const noexcept {
        return !canMove(tetromino, 0, 0);
    }

    // Write the piece color into the board; cells above row 0 are dropped
    void lockTetromino(const Tetromino& tetromino) noexcept;

    bool isRowComplete(int row) const;

    // Indices of complete rows, ascending
    std::vector<int> completedRows() const;

    // Clear every complete row (highest index first), return how many were cleared
    int clearCompletedRows();

    // Row at which the piece would come to rest if dropped straight down
    int findDropRow(const Tetromino& tetromino) const noexcept;

    bool operator==(const Board& other) const noexcept {
        return rows_ == other.rows_ && cols_ == other.cols_ && grid_ == other.grid_;
    }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int rows_;
    int cols_;
    std::vector<Color> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    void clearRow(int row);
};

} // namespace handtris::core
