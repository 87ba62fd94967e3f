#include "core/Board.hpp"

#include <algorithm>
#include <stdexcept>

namespace handtris::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), EmptyCell);
}

Color Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, Color color) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    if (color != EmptyCell && !isPieceColor(color)) {
        throw std::invalid_argument("Board::setCell unknown color");
    }
    grid_[index(row, col)] = color;
}

void Board::assign(const std::vector<Color>& cells) {
    if (cells.size() != grid_.size()) {
        throw std::invalid_argument("Board::assign size mismatch");
    }
    grid_ = cells;
}

void Board::clear() noexcept {
    std::fill(grid_.begin(), grid_.end(), EmptyCell);
}

bool Board::canMove(const Tetromino& tetromino, int dx, int dy) const noexcept {
    for (const auto& b : tetromino.blocks()) {
        const int newCol = b.col + dx;
        const int newRow = b.row + dy;

        if (newCol < 0 || newCol >= cols_ || newRow >= rows_) {
            return false; // walls or floor
        }
        // Above the top edge only the walls matter
        if (newRow >= 0 && grid_[index(newRow, newCol)] != EmptyCell) {
            return false;
        }
    }
    return true;
}

void Board::lockTetromino(const Tetromino& tetromino) noexcept {
    const Color color = tetromino.color();
    for (const auto& b : tetromino.blocks()) {
        if (isInside(b.row, b.col)) {
            grid_[index(b.row, b.col)] = color;
        }
    }
}

bool Board::isRowComplete(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowComplete out of range");
    }
    for (int col = 0; col < cols_; ++col) {
        if (grid_[index(row, col)] == EmptyCell) {
            return false;
        }
    }
    return true;
}

std::vector<int> Board::completedRows() const {
    std::vector<int> rows;
    for (int row = 0; row < rows_; ++row) {
        if (isRowComplete(row)) {
            rows.push_back(row);
        }
    }
    return rows;
}

int Board::clearCompletedRows() {
    const std::vector<int> rows = completedRows();

    // Collect first, then clear from the bottom up. Each clear pulls every
    // pending (higher) row down by one, hence the offset.
    int cleared = 0;
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
        clearRow(*it + cleared);
        ++cleared;
    }
    return static_cast<int>(rows.size());
}

void Board::clearRow(int row) {
    // Shift rows above down by 1
    for (int r = row; r > 0; --r) {
        for (int c = 0; c < cols_; ++c) {
            grid_[index(r, c)] = grid_[index(r - 1, c)];
        }
    }
    // Clear top row
    for (int c = 0; c < cols_; ++c) {
        grid_[index(0, c)] = EmptyCell;
    }
}

int Board::findDropRow(const Tetromino& tetromino) const noexcept {
    int dropRow = tetromino.y();
    while (canMove(tetromino, 0, dropRow - tetromino.y() + 1)) {
        ++dropRow;
    }
    return dropRow;
}

} // namespace handtris::core
