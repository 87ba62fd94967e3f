#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "storage/SnapshotSerialization.hpp"

using namespace handtris::core;
using handtris::storage::deserializeSnapshot;
using handtris::storage::serializeSnapshot;

namespace {

GameSnapshot smallSnapshot() {
    GameSnapshot s;
    s.rows = 2;
    s.cols = 3;
    s.cells = {EmptyCell, colorFor(PieceType::T), EmptyCell,
               colorFor(PieceType::I), colorFor(PieceType::I), EmptyCell};
    s.score = 300;
    s.highScore = 1200;
    s.isGameOver = false;
    s.isPaused = true;
    s.currentPiece = CurrentPieceSnapshot{PieceType::S, 3, -1, -2};
    s.nextPieceType = PieceType::Z;
    return s;
}

} // namespace

TEST_CASE("SnapshotSerialization: live game round-trip", "[storage][serialization]")
{
    GameState game{20, 10, 17u};
    game.spawnPiece();
    REQUIRE(game.hardDrop().has_value());

    const GameSnapshot original = game.save();
    const auto parsed = deserializeSnapshot(serializeSnapshot(original));

    REQUIRE(parsed.has_value());
    CHECK(*parsed == original);
}

TEST_CASE("SnapshotSerialization: negative piece coordinates survive", "[storage][serialization]")
{
    const GameSnapshot original = smallSnapshot();
    const std::string line = serializeSnapshot(original);

    CHECK(line.rfind("SNAPSHOT;2;3;", 0) == 0);

    const auto parsed = deserializeSnapshot(line);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->currentPiece.has_value());
    CHECK(parsed->currentPiece->x == -1);
    CHECK(parsed->currentPiece->y == -2);
    CHECK(parsed->currentPiece->rotation == 3);
}

TEST_CASE("SnapshotSerialization: no current piece", "[storage][serialization]")
{
    GameSnapshot original = smallSnapshot();
    original.currentPiece.reset();

    const std::string line = serializeSnapshot(original);
    CHECK(line.find(";N;") != std::string::npos);

    const auto parsed = deserializeSnapshot(line);
    REQUIRE(parsed.has_value());
    CHECK_FALSE(parsed->currentPiece.has_value());
    CHECK(*parsed == original);
}

TEST_CASE("SnapshotSerialization: malformed lines are rejected", "[storage][serialization]")
{
    const std::string good = serializeSnapshot(smallSnapshot());
    REQUIRE(deserializeSnapshot(good).has_value());

    // Flip one thing at a time
    CHECK_FALSE(deserializeSnapshot("").has_value());
    CHECK_FALSE(deserializeSnapshot("STATE" + good.substr(8)).has_value());

    // 2x3 grid with five cells
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;2;3;0,0,0,0,0;0;0;0;0;N;1").has_value());

    // Unknown next piece ordinal
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;1;1;0;0;0;0;0;N;7").has_value());

    // Unknown current piece ordinal
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;1;1;0;0;0;0;0;P;9;0;0;0;1").has_value());

    // Flags are 0 or 1
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;1;1;0;0;0;2;0;N;1").has_value());

    // Trailing garbage in a number
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;1;1;0;10x;0;0;0;N;1").has_value());

    // Piece marker without piece fields
    CHECK_FALSE(deserializeSnapshot(
        "SNAPSHOT;1;1;0;0;0;0;0;P;1").has_value());

    // Minimal valid line for comparison
    CHECK(deserializeSnapshot(
        "SNAPSHOT;1;1;0;0;0;0;0;N;1").has_value());
}

TEST_CASE("SnapshotSerialization: a parsed piece far off the board is refused by restore", "[storage][serialization]")
{
    GameState game{20, 10, 17u};
    game.spawnPiece();
    const GameSnapshot before = game.save();

    GameSnapshot far = before;
    far.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 2147483647, 0};

    // The codec only checks syntax
    const auto parsed = deserializeSnapshot(serializeSnapshot(far));
    REQUIRE(parsed.has_value());
    CHECK(parsed->currentPiece->x == 2147483647);

    REQUIRE_THROWS_AS(game.restore(*parsed), std::invalid_argument);
    CHECK(game.save() == before);
}
