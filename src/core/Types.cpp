#include "core/Types.hpp"

namespace handtris::core {

Color colorFor(PieceType type) noexcept {
    switch (type) {
    case PieceType::I: return rgb(  0, 183, 183);
    case PieceType::J: return rgb(  0,   0, 183);
    case PieceType::L: return rgb(183,  91,   0);
    case PieceType::O: return rgb(255, 191,   0);
    case PieceType::S: return rgb(  0, 183,   0);
    case PieceType::T: return rgb(142,  68, 173);
    case PieceType::Z: return rgb(183,   0,   0);
    }
    return rgb(128, 128, 128);
}

Color mainColorFor(PieceType type) noexcept {
    switch (type) {
    case PieceType::I: return rgb(  0, 255, 255);
    case PieceType::J: return rgb(  0,   0, 255);
    case PieceType::L: return rgb(255, 127,   0);
    case PieceType::O: return rgb(255, 255,  64);
    case PieceType::S: return rgb(  0, 255,   0);
    case PieceType::T: return rgb(155,  89, 182);
    case PieceType::Z: return rgb(255,   0,   0);
    }
    return rgb(200, 200, 200);
}

bool isPieceColor(Color c) noexcept {
    for (PieceType t : AllPieceTypes) {
        if (colorFor(t) == c) {
            return true;
        }
    }
    return false;
}

bool pieceTypeFromOrdinal(int ordinal, PieceType& out) noexcept {
    if (ordinal < 0 || ordinal >= PieceTypeCount) {
        return false;
    }
    out = static_cast<PieceType>(ordinal);
    return true;
}

char pieceTypeName(PieceType type) noexcept {
    static constexpr char names[PieceTypeCount] = {'I', 'J', 'L', 'O', 'S', 'T', 'Z'};
    return names[static_cast<int>(type)];
}

} // namespace handtris::core
