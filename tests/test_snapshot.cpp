#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>

#include "core/GameSnapshot.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"

using namespace handtris::core;

TEST_CASE("A snapshot from save() validates against the same board", "[snapshot]") {
    GameState game{20, 10, 9u};
    game.spawnPiece();

    const GameSnapshot s = game.save();
    REQUIRE(s.rows == 20);
    REQUIRE(s.cols == 10);
    REQUIRE(s.cells.size() == 200);
    REQUIRE(s.currentPiece.has_value());
    REQUIRE_FALSE(validateSnapshot(s, 20, 10).has_value());
}

TEST_CASE("validateSnapshot reports each kind of problem", "[snapshot]") {
    GameState game{20, 10, 9u};
    game.spawnPiece();
    const GameSnapshot good = game.save();

    SECTION("Dimensions differ from the board") {
        REQUIRE(validateSnapshot(good, 22, 10).has_value());
    }

    SECTION("Cell count does not match the dimensions") {
        GameSnapshot s = good;
        s.cells.pop_back();
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
    }

    SECTION("Cell holds an unknown color") {
        GameSnapshot s = good;
        s.cells[42] = 0xFF010203u;
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
    }

    SECTION("Rotation out of range") {
        GameSnapshot s = good;
        s.currentPiece->rotation = 4;
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
        s.currentPiece->rotation = -1;
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
    }

    SECTION("Current piece outside the board") {
        GameSnapshot s = good;

        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, std::numeric_limits<int>::max(), 0};
        REQUIRE(validateSnapshot(s, 20, 10).has_value());

        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 0, std::numeric_limits<int>::min()};
        REQUIRE(validateSnapshot(s, 20, 10).has_value());

        // Horizontal I covers columns x..x+3
        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, -1, 5};
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 7, 5};
        REQUIRE(validateSnapshot(s, 20, 10).has_value());

        // Its row is y+1, so y = 19 is below the floor
        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 3, 19};
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
    }

    SECTION("Current piece partly above the top is accepted") {
        GameSnapshot s = good;
        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 1, 3, -2};
        REQUIRE_FALSE(validateSnapshot(s, 20, 10).has_value());

        s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 6, 18};
        REQUIRE_FALSE(validateSnapshot(s, 20, 10).has_value());
    }

    SECTION("Piece type outside the known ordinals") {
        GameSnapshot s = good;
        s.nextPieceType = static_cast<PieceType>(PieceTypeCount);
        REQUIRE(validateSnapshot(s, 20, 10).has_value());
    }
}

TEST_CASE("Restoring a saved snapshot reproduces the game", "[snapshot]") {
    GameState original{20, 10, 21u};
    original.spawnPiece();
    REQUIRE(original.moveLeft());
    REQUIRE(original.hardDrop().has_value());
    original.setPaused(true);

    const GameSnapshot saved = original.save();

    GameState copy{20, 10, 99u};
    copy.restore(saved);

    REQUIRE(copy.save() == saved);
    REQUIRE(copy.board() == original.board());
    REQUIRE(*copy.currentPiece() == *original.currentPiece());
    REQUIRE(copy.nextPiece().type() == original.nextPiece().type());
    REQUIRE(copy.isPaused());
}

TEST_CASE("Rejected snapshot leaves the game untouched", "[snapshot]") {
    GameState game{20, 10, 4u};
    game.spawnPiece();
    const GameSnapshot before = game.save();

    GameSnapshot bad = before;
    bad.score = 12345;
    bad.cells[0] = colorFor(PieceType::Z);
    bad.currentPiece->rotation = 7;

    REQUIRE_THROWS_AS(game.restore(bad), std::invalid_argument);
    REQUIRE(game.save() == before);

    GameSnapshot wrongSize = before;
    wrongSize.rows = 10;
    REQUIRE_THROWS_AS(game.restore(wrongSize), std::invalid_argument);
    REQUIRE(game.save() == before);
}

TEST_CASE("Snapshot without a current piece restores to no piece", "[snapshot]") {
    GameState game{20, 10, 4u};
    game.spawnPiece();

    GameSnapshot s = game.save();
    s.currentPiece.reset();
    game.restore(s);

    REQUIRE_FALSE(game.currentPiece().has_value());
}
