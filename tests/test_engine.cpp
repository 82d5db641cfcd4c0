#include <doctest/doctest.h>

#include "backend/engine.hpp"
#include "iso_fixtures.hpp"

#include <stdexcept>

using namespace gridduel;

TEST_CASE("difficulty labels") {
    CHECK(normalize_difficulty("NEXUS-7") == 7);
    CHECK(normalize_difficulty("nexus-5") == 5);
    CHECK(normalize_difficulty("easy") == 3);
    CHECK(normalize_difficulty("Hard") == 7);
    CHECK(normalize_difficulty("9") == DIFFICULTY_UNKNOWN);
    CHECK(normalize_difficulty(5) == 5);
    CHECK(normalize_difficulty(4) == DIFFICULTY_UNKNOWN);
}

TEST_CASE("board validation") {
    CHECK_THROWS_AS(validate_hex_board(std::vector<int>(120, 0)), std::invalid_argument);
    CHECK_NOTHROW(validate_hex_board(std::vector<int>(121, 0)));

    std::vector<int> bad_hex(121, 0);
    bad_hex[10] = 3;
    CHECK_THROWS_AS(validate_hex_board(bad_hex), std::invalid_argument);

    CHECK_THROWS_AS(validate_isolation_board(std::vector<int>(48, 0)), std::invalid_argument);
    std::vector<int> bad_iso(49, 0);
    bad_iso[3] = -1;
    CHECK_THROWS_AS(validate_isolation_board(bad_iso), std::invalid_argument);
    CHECK_NOTHROW(validate_isolation_board(test::to_cells(iso::State::initial())));

    std::vector<int> no_room(49, iso::CELL_DESTROYED);
    no_room[24] = iso::CELL_AI;
    CHECK_THROWS_AS(validate_isolation_board(no_room), std::invalid_argument);
}

TEST_CASE("isolation facade rejects a board with no cell for a missing piece") {
    IsolationMoveRequest req;
    req.board.assign(iso::CELL_COUNT, iso::CELL_DESTROYED);
    req.board[iso::sq_index(3, 3)] = iso::CELL_HUMAN;

    ManualClock clock;
    CHECK_THROWS_WITH_AS(isolation_best_move(req, clock),
                         "isolation board has no free cell for a missing piece",
                         std::invalid_argument);
    CHECK_THROWS_AS(isolation_analyze(req.board, 5), std::invalid_argument);
}

TEST_CASE("hex facade returns an empty cell") {
    HexMoveRequest req;
    req.board.assign(hex::CELL_COUNT, 0);
    req.board[hex::cell_index(5, 5)] = 1;
    req.max_simulations = 400;
    req.seed = 7;

    ManualClock clock;
    hex::SearchResult r = hex_best_move(req, clock);
    REQUIRE(r.found);
    CHECK(r.total_simulations == 400);
    CHECK(req.board[hex::cell_index(r.best.row, r.best.col)] == 0);
}

TEST_CASE("hex facade rejects short boards") {
    HexMoveRequest req;
    req.board.assign(10, 0);
    CHECK_THROWS_WITH_AS(hex_best_move(req), "hex board must have 121 cells, got 10",
                         std::invalid_argument);
}

TEST_CASE("isolation facade plays a legal move") {
    IsolationMoveRequest req;
    req.board = test::to_cells(iso::State::initial());
    req.difficulty = 3;
    req.time_ms = 500;

    ManualClock clock;
    iso::SearchResult r = isolation_best_move(req, clock);
    REQUIRE(r.found);
    CHECK(iso::State::initial().is_legal(Side::Ai, r.move));
}

TEST_CASE("isolation facade honours the side to move") {
    // Band wall with the pieces swapped: the human owns the smaller side.
    iso::State st = test::board_from_rows({
        "A.....#",
        ".....##",
        "....##.",
        "...##..",
        "..##...",
        ".##....",
        "##....H",
    });
    IsolationMoveRequest req;
    req.board = test::to_cells(st);
    req.ai_turn = false;

    ManualClock clock;
    iso::SearchResult r = isolation_best_move(req, clock);
    REQUIRE(r.found);
    CHECK(r.move.from == iso::sq_index(6, 6));
    CHECK(r.source == iso::MoveSource::EndgameSolver);
    CHECK(r.solved);
    CHECK(r.score < -iso::SCORE_SOLVED);
    CHECK(st.is_legal(Side::Human, r.move));
}

TEST_CASE("analysis summarises a sealed board") {
    IsolationAnalysis a = isolation_analyze(test::to_cells(test::band_wall()), 5);
    CHECK(a.partition.is_partitioned);
    CHECK(a.partition.human_region_size == 20);
    CHECK(a.partition.ai_region_size == 14);
    CHECK(a.critical_cells.empty());
    CHECK(a.components.partitioned);
    CHECK(a.score == a.components.total);
    CHECK(a.human_mobility == 12);
    CHECK(a.ai_mobility == 10);
}
