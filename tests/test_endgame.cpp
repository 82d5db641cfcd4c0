#include <doctest/doctest.h>

#include "engine/common/clock.hpp"
#include "engine/isolation/endgame.hpp"
#include "iso_fixtures.hpp"

using namespace gridduel;
using namespace gridduel::iso;

static State corridor() {
    return test::board_from_rows({
        "A..####",
        "#######",
        "#######",
        "#######",
        "#######",
        "#######",
        "######H",
    });
}

TEST_CASE("longest path along a short corridor") {
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    CHECK(solver.longest_path(corridor(), Side::Ai) == 2);
    CHECK(solver.longest_path(corridor(), Side::Human) == 0);
}

TEST_CASE("exact solve walks the corridor and burns the cell behind") {
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    EndgameResult r = solver.solve(corridor(), Side::Ai);
    REQUIRE(r.found);
    CHECK(r.confidence == Confidence::Exact);
    CHECK(r.path_length == 2);
    CHECK(r.move.from == sq_index(0, 0));
    CHECK(r.move.to == sq_index(0, 1));
    CHECK(r.move.destroy == sq_index(0, 0));
    CHECK(corridor().is_legal(Side::Ai, r.move));
}

TEST_CASE("solver stays exact inside the sealed band") {
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    State st = test::band_wall();
    EndgameResult r = solver.solve(st, Side::Ai);
    REQUIRE(r.found);
    CHECK(r.confidence == Confidence::Exact);
    CHECK(r.path_length >= 1);
    CHECK(r.path_length <= 14);
    CHECK(sq_row(r.move.to) + sq_col(r.move.to) >= 8);
    CHECK(st.is_legal(Side::Ai, r.move));
    CHECK_FALSE(solver.timed_out());
}

TEST_CASE("an exhausted budget degrades to a heuristic answer") {
    ManualClock clock(0.0, 1000.0);
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    EndgameResult r = solver.solve(corridor(), Side::Ai);
    REQUIRE(r.found);
    CHECK(r.confidence == Confidence::Heuristic);
    CHECK(solver.timed_out());
    CHECK(corridor().is_legal(Side::Ai, r.move));
}

TEST_CASE("stuck piece has nothing to solve") {
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    EndgameResult r = solver.solve(corridor(), Side::Human);
    CHECK_FALSE(r.found);
}

TEST_CASE("opponent path check stops at the target") {
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);
    State st = test::band_wall();

    PathCheck human = solver.path_reaches(st, Side::Human, 14);
    CHECK(human.verdict == PathVerdict::Reaches);
    CHECK(human.length >= 14);

    PathCheck corridor_ai = solver.path_reaches(corridor(), Side::Ai, 3);
    CHECK(corridor_ai.verdict == PathVerdict::Short);
    CHECK(corridor_ai.length == 2);
}

TEST_CASE("memo cap ends a large region without a clock") {
    // 22 empty cells on the AI side of a two-wide band.
    State st = test::board_from_rows({
        "H...##.",
        "...##..",
        "..##...",
        ".##A...",
        "##....#",
        "#.....#",
        "....###",
    });
    ManualClock clock;
    Deadline deadline(clock, 1000.0);
    EndgameSolver solver(deadline);

    EndgameResult r = solver.solve(st, Side::Ai);
    REQUIRE(r.found);
    CHECK(st.is_legal(Side::Ai, r.move));
    CHECK(solver.memo_size() <= MEMO_LIMIT);
    CHECK(r.nodes <= MEMO_LIMIT * CELL_COUNT);
    CHECK_FALSE(solver.timed_out());
    if (solver.memo_full()) CHECK(r.confidence == Confidence::Heuristic);
}

TEST_CASE("region size helpers") {
    CHECK(estimate_longest_path(20) == 15);
    CHECK(estimate_longest_path(0) == 0);
    CHECK(should_solve_exactly(EXACT_REGION_LIMIT));
    CHECK_FALSE(should_solve_exactly(EXACT_REGION_LIMIT + 1));
}
