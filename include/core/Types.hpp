#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for handtris core types
namespace handtris::core {

// Position structure representing a cell in the grid
struct Position {
    int row{};
    int col{};
};

// Rotation states for Tetrominoes (clockwise quarter turns from spawn)
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// Tetromino types. The order is the persisted ordinal, do not reorder.
enum class PieceType : std::uint8_t {
    I, J, L, O, S, T, Z
};

inline constexpr int PieceTypeCount = 7;

inline constexpr std::array<PieceType, PieceTypeCount> AllPieceTypes{
    PieceType::I, PieceType::J, PieceType::L, PieceType::O,
    PieceType::S, PieceType::T, PieceType::Z
};

// Opaque 0xAARRGGBB color identifier stored in board cells
using Color = std::uint32_t;

// Empty board cell
inline constexpr Color EmptyCell = 0;

inline constexpr Color rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return 0xFF000000U
        | (static_cast<Color>(r) << 16)
        | (static_cast<Color>(g) << 8)
        | static_cast<Color>(b);
}

// Lock color of a piece type (what ends up in the board)
Color colorFor(PieceType type) noexcept;

// Brighter variant, for renderers only
Color mainColorFor(PieceType type) noexcept;

// True if `c` is one of the seven lock colors
bool isPieceColor(Color c) noexcept;

// Decode a persisted ordinal; returns false for unknown values
bool pieceTypeFromOrdinal(int ordinal, PieceType& out) noexcept;

inline int ordinalOf(PieceType type) noexcept {
    return static_cast<int>(type);
}

char pieceTypeName(PieceType type) noexcept;

} // namespace handtris::core
