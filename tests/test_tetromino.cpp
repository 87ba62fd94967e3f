#include <catch2/catch_test_macros.hpp>

#include <set>
#include <utility>

#include "core/Tetromino.hpp"
#include "core/Types.hpp"

using namespace handtris::core;

TEST_CASE("Every piece type has four blocks in every rotation", "[tetromino]") {
    for (PieceType type : AllPieceTypes) {
        Tetromino t{type};
        for (int turn = 0; turn < 4; ++turn) {
            std::set<std::pair<int, int>> cells;
            for (const auto& b : t.blocks()) {
                cells.insert({b.row, b.col});
            }
            REQUIRE(cells.size() == 4);
            t.rotateClockwise();
        }
    }
}

TEST_CASE("Four clockwise turns return to the spawn shape", "[tetromino]") {
    for (PieceType type : AllPieceTypes) {
        Tetromino t{type};
        const ShapeMatrix spawn = t.shape();

        for (int turn = 0; turn < 4; ++turn) {
            t.rotateClockwise();
        }

        REQUIRE(t.rotation() == Rotation::R0);
        REQUIRE(t.shape() == spawn);
    }
}

TEST_CASE("Matrix sizes: I is 4x4, the others 3x3", "[tetromino]") {
    REQUIRE(Tetromino::baseShape(PieceType::I).size == 4);
    for (PieceType type : {PieceType::J, PieceType::L, PieceType::O,
                           PieceType::S, PieceType::T, PieceType::Z}) {
        REQUIRE(Tetromino::baseShape(type).size == 3);
    }
}

TEST_CASE("Clockwise turn moves row i to column n-1-i", "[tetromino]") {
    // I spawns on row 1 of its 4x4 matrix; one turn puts it on column 2
    Tetromino t{PieceType::I};
    t.rotateClockwise();
    const ShapeMatrix m = t.shape();

    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            REQUIRE(m.filled(r, c) == (c == 2));
        }
    }
}

TEST_CASE("T shape after one turn points right", "[tetromino]") {
    // .#.      .#.
    // ###  ->  .##
    // ...      .#.
    Tetromino t{PieceType::T};
    t.rotateClockwise();
    const ShapeMatrix m = t.shape();

    CHECK(m.filled(0, 1));
    CHECK(m.filled(1, 1));
    CHECK(m.filled(1, 2));
    CHECK(m.filled(2, 1));
    CHECK_FALSE(m.filled(1, 0));
}

TEST_CASE("Blocks are offset by the piece position", "[tetromino]") {
    Tetromino t{PieceType::O, Rotation::R0, 3, 5};
    const auto blocks = t.blocks();

    // O occupies the lower-right 2x2 of its 3x3 matrix
    std::set<std::pair<int, int>> cells;
    for (const auto& b : blocks) {
        cells.insert({b.row, b.col});
    }
    REQUIRE(cells == std::set<std::pair<int, int>>{{6, 4}, {6, 5}, {7, 4}, {7, 5}});
}

TEST_CASE("Piece colors are distinct and recognised", "[tetromino][types]") {
    std::set<Color> colors;
    for (PieceType type : AllPieceTypes) {
        const Color c = colorFor(type);
        REQUIRE(isPieceColor(c));
        colors.insert(c);
    }
    REQUIRE(colors.size() == PieceTypeCount);
    REQUIRE_FALSE(isPieceColor(EmptyCell));
    REQUIRE(colorFor(PieceType::T) == rgb(142, 68, 173));
}

TEST_CASE("Persisted ordinals decode only for known types", "[types]") {
    PieceType out{};
    REQUIRE(pieceTypeFromOrdinal(6, out));
    REQUIRE(out == PieceType::Z);
    REQUIRE_FALSE(pieceTypeFromOrdinal(7, out));
    REQUIRE_FALSE(pieceTypeFromOrdinal(-1, out));
}
