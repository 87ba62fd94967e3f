// tests/test_controller.cpp

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>

#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/Clock.hpp"
#include "controller/ControllerConfig.hpp"
#include "controller/GameController.hpp"

using namespace std::chrono_literals;

using handtris::core::CurrentPieceSnapshot;
using handtris::core::GameSnapshot;
using handtris::core::GameState;
using handtris::core::PieceType;
using handtris::core::colorFor;
using handtris::controller::ControllerConfig;
using handtris::controller::GameController;
using handtris::controller::ManualClock;

namespace {

struct Fixture {
    GameState game{20, 10, 11u};
    ManualClock clock;
    GameController controller{game, clock};

    // Running game with `type` at (x, y)
    void place(PieceType type, int rotation, int x, int y) {
        GameSnapshot s = game.save();
        s.currentPiece = CurrentPieceSnapshot{type, rotation, x, y};
        s.isPaused = false;
        s.isGameOver = false;
        controller.restore(s);
    }

    // Advance the clock and the gravity accumulator together
    void advance(std::chrono::milliseconds d) {
        clock.advance(d);
        controller.update(d);
    }
};

} // namespace

TEST_CASE("start spawns a piece and runs gravity", "[controller]")
{
    Fixture f;
    REQUIRE_FALSE(f.controller.isGravityRunning());

    f.controller.start();
    REQUIRE(f.game.currentPiece().has_value());
    REQUIRE_FALSE(f.game.isPaused());
    REQUIRE(f.controller.isGravityRunning());
}

TEST_CASE("Gravity moves the piece once per full interval", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 0);

    f.advance(499ms);
    REQUIRE(f.game.currentPiece()->y() == 0);
    f.advance(1ms);
    REQUIRE(f.game.currentPiece()->y() == 1);

    // A long frame catches up
    f.advance(1500ms);
    REQUIRE(f.game.currentPiece()->y() == 4);
}

TEST_CASE("Gravity locks a resting piece", "[controller]")
{
    Fixture f;
    f.place(PieceType::O, 0, 3, 17); // already on the floor

    f.advance(500ms);
    REQUIRE(f.game.lockedPieces() == 1);
    REQUIRE(f.game.board().cell(19, 4) == colorFor(PieceType::O));
    REQUIRE(f.game.currentPiece()->y() == 0);
}

TEST_CASE("After a lock the new piece hangs for the drop cooldown", "[controller]")
{
    Fixture f;
    f.place(PieceType::O, 0, 3, 17);
    f.advance(500ms); // locks
    REQUIRE(f.game.lockedPieces() == 1);

    for (int i = 0; i < 9; ++i) {
        f.advance(500ms);
    }
    REQUIRE(f.game.currentPiece()->y() == 0); // 4.5 s after the lock

    f.advance(500ms);
    REQUIRE(f.game.currentPiece()->y() == 1);
}

TEST_CASE("Pointer zones use strict comparisons", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 5);

    REQUIRE_FALSE(f.controller.handlePointer(0.4f, true));
    REQUIRE_FALSE(f.controller.handlePointer(0.5f, true));
    REQUIRE_FALSE(f.controller.handlePointer(0.6f, true));
    REQUIRE(f.game.currentPiece()->x() == 3);

    REQUIRE(f.controller.handlePointer(0.3999f, true));
    REQUIRE(f.game.currentPiece()->x() == 2);

    f.clock.advance(150ms);
    REQUIRE(f.controller.handlePointer(0.6001f, true));
    REQUIRE(f.game.currentPiece()->x() == 3);
}

TEST_CASE("Pointer without an extended finger only records the position", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 5);

    REQUIRE_FALSE(f.controller.handlePointer(0.1f, false));
    REQUIRE(f.game.currentPiece()->x() == 3);
    REQUIRE(f.controller.lastPointerX().has_value());
    REQUIRE(*f.controller.lastPointerX() == 0.1f);
}

TEST_CASE("Lateral moves are spaced by the move delay", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 5);

    REQUIRE(f.controller.handlePointer(0.1f, true));
    f.clock.advance(100ms);
    REQUIRE_FALSE(f.controller.handlePointer(0.1f, true));
    f.clock.advance(50ms);
    REQUIRE(f.controller.handlePointer(0.1f, true));
    REQUIRE(f.game.currentPiece()->x() == 1);
}

TEST_CASE("Rotation cooldown", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 5);

    REQUIRE(f.controller.requestRotate());
    f.clock.advance(799ms);
    REQUIRE_FALSE(f.controller.requestRotate());
    f.clock.advance(1ms);
    REQUIRE(f.controller.requestRotate());
}

TEST_CASE("A refused rotation does not start the cooldown", "[controller]")
{
    Fixture f;
    // Vertical I against the right wall cannot turn
    f.place(PieceType::I, 1, 7, 5);
    REQUIRE_FALSE(f.controller.requestRotate());

    f.place(PieceType::T, 0, 3, 5);
    REQUIRE(f.controller.requestRotate());
}

TEST_CASE("Two hard drops inside the cooldown lock one piece", "[controller]")
{
    Fixture f;
    f.controller.start();

    REQUIRE(f.controller.requestHardDrop());
    REQUIRE_FALSE(f.controller.requestHardDrop());
    REQUIRE(f.game.lockedPieces() == 1);

    f.clock.advance(1500ms);
    REQUIRE(f.controller.requestHardDrop());
    REQUIRE(f.game.lockedPieces() == 2);
}

TEST_CASE("Pause stops gravity and every action", "[controller]")
{
    Fixture f;
    f.place(PieceType::T, 0, 3, 5);
    f.controller.pause();

    REQUIRE(f.game.isPaused());
    REQUIRE_FALSE(f.controller.isGravityRunning());

    f.advance(5000ms);
    REQUIRE(f.game.currentPiece()->y() == 5);

    f.controller.gravityTick();
    REQUIRE(f.game.currentPiece()->y() == 5);

    REQUIRE_FALSE(f.controller.handlePointer(0.1f, true));
    REQUIRE_FALSE(f.controller.requestRotate());
    REQUIRE_FALSE(f.controller.requestHardDrop());
    REQUIRE(f.game.lockedPieces() == 0);

    f.controller.start();
    f.advance(500ms);
    REQUIRE(f.game.currentPiece()->y() == 6);
}

TEST_CASE("Game over stops gravity", "[controller]")
{
    Fixture f;

    GameSnapshot s = f.game.save();
    for (int r = 1; r < 20; ++r) {
        for (int c = 0; c < 9; ++c) {
            s.cells[r * 10 + c] = colorFor(PieceType::J);
        }
    }
    s.currentPiece = CurrentPieceSnapshot{PieceType::I, 0, 3, -1};
    s.nextPieceType = PieceType::O;
    s.isPaused = false;
    f.controller.restore(s);
    REQUIRE(f.controller.isGravityRunning());

    REQUIRE(f.controller.requestHardDrop());
    REQUIRE(f.game.isGameOver());
    REQUIRE_FALSE(f.controller.isGravityRunning());

    f.clock.advance(2000ms);
    REQUIRE_FALSE(f.controller.requestHardDrop());
    REQUIRE_FALSE(f.controller.requestRotate());
}

TEST_CASE("Restore resumes gravity only for a running snapshot", "[controller]")
{
    Fixture f;
    f.controller.start();
    GameSnapshot s = f.controller.save();

    s.isPaused = true;
    f.controller.restore(s);
    REQUIRE_FALSE(f.controller.isGravityRunning());

    s.isPaused = false;
    f.controller.restore(s);
    REQUIRE(f.controller.isGravityRunning());
}

TEST_CASE("Reset clears cooldowns and stops gravity", "[controller]")
{
    Fixture f;
    f.controller.start();
    REQUIRE(f.controller.requestHardDrop());

    f.controller.reset();
    REQUIRE(f.game.isPaused());
    REQUIRE_FALSE(f.controller.isGravityRunning());
    REQUIRE_FALSE(f.controller.lastPointerX().has_value());

    f.controller.start();
    REQUIRE(f.controller.requestHardDrop());
    REQUIRE(f.game.lockedPieces() == 1);
}

TEST_CASE("Invalid controller configuration is rejected", "[controller][config]")
{
    GameState game;
    ManualClock clock;

    ControllerConfig zeroGravity;
    zeroGravity.gravityInterval = 0ms;
    REQUIRE_THROWS_AS(GameController(game, clock, zeroGravity), std::invalid_argument);

    ControllerConfig crossedZones;
    crossedZones.leftZone = 0.7f;
    crossedZones.rightZone = 0.3f;
    REQUIRE_THROWS_AS(crossedZones.validate(), std::invalid_argument);

    ControllerConfig negative;
    negative.rotationCooldown = -1ms;
    REQUIRE_THROWS_AS(negative.validate(), std::invalid_argument);

    REQUIRE_NOTHROW(ControllerConfig{}.validate());
}
