#include <doctest/doctest.h>

#include "engine/isolation/bitboard.hpp"
#include "engine/isolation/iso_state.hpp"
#include "iso_fixtures.hpp"

#include <random>

using namespace gridduel;
using namespace gridduel::iso;

TEST_CASE("queen moves on an empty board") {
    CHECK(bb_popcount(queen_moves(sq_index(0, 0), 0)) == 18);
    CHECK(bb_popcount(queen_moves(sq_index(3, 3), 0)) == 24);
    CHECK(bb_popcount(queen_moves(sq_index(0, 3), 0)) == 18);
}

TEST_CASE("bit-parallel expansion never wraps across columns") {
    Bitboard from_right_edge = queen_moves(sq_index(0, 6), 0);
    CHECK((from_right_edge & sq_bit(sq_index(1, 0))) == 0);
    CHECK((from_right_edge & sq_bit(sq_index(0, 5))) != 0);

    Bitboard from_left_edge = queen_moves(sq_index(4, 0), 0);
    CHECK((from_left_edge & sq_bit(sq_index(3, 6))) == 0);
    CHECK((from_left_edge & ~FULL_BOARD) == 0);
}

TEST_CASE("bit-parallel and ray-cast queen moves agree") {
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<int> density(0, 4);
    for (int trial = 0; trial < 300; trial++) {
        Bitboard blocked = 0;
        int keep = density(rng);
        for (int sq = 0; sq < CELL_COUNT; sq++) {
            if ((int)(rng() % 8) < keep) blocked |= sq_bit(sq);
        }
        for (int sq = 0; sq < CELL_COUNT; sq++) {
            REQUIRE(queen_moves(sq, blocked) == queen_moves_ray(sq, blocked));
        }
    }
}

TEST_CASE("blocked cells stop a slide") {
    Bitboard blocked = sq_bit(sq_index(0, 3));
    Bitboard m = queen_moves(sq_index(0, 0), blocked);
    CHECK((m & sq_bit(sq_index(0, 2))) != 0);
    CHECK((m & sq_bit(sq_index(0, 3))) == 0);
    CHECK((m & sq_bit(sq_index(0, 4))) == 0);
}

TEST_CASE("queen flood fill") {
    CHECK(bb_popcount(queen_flood_fill(0, sq_bit(48))) == 47);

    iso::State corridor = test::board_from_rows({
        "A..####",
        "#######",
        "#######",
        "#######",
        "#######",
        "#######",
        "######H",
    });
    CHECK(queen_flood_fill(0, corridor.blocked()) == (sq_bit(1) | sq_bit(2)));
}

TEST_CASE("safe index falls back on an empty mask") {
    CHECK(safe_index(0, 17) == 17);
    CHECK(safe_index(sq_bit(30), 17) == 30);
}

TEST_CASE("state apply keeps masks disjoint") {
    State st = State::initial();
    CHECK(st.well_formed());
    CHECK(st.piece_sq(Side::Human) == 0);
    CHECK(st.piece_sq(Side::Ai) == 48);

    Move m;
    m.from = 48;
    m.to = sq_index(3, 3);
    m.destroy = 48;
    REQUIRE(st.is_legal(Side::Ai, m));
    State next = st.apply(Side::Ai, m);
    CHECK(next.well_formed());
    CHECK(next.destroyed_count() == 1);
    CHECK(next.piece_sq(Side::Ai) == sq_index(3, 3));

    Move onto_piece = m;
    onto_piece.destroy = 0;
    CHECK_FALSE(st.is_legal(Side::Ai, onto_piece));
}

TEST_CASE("from_raw clamps and from_cells defaults missing pieces") {
    State st = State::from_raw(-3, 2, 9, 9, {5, 48});
    CHECK(st.piece_sq(Side::Human) == sq_index(0, 2));
    CHECK(st.piece_sq(Side::Ai) == 48);
    CHECK(st.destroyed == sq_bit(5));

    std::vector<int> cells(CELL_COUNT, CELL_EMPTY);
    cells[10] = CELL_AI;
    State only_ai = State::from_cells(cells);
    CHECK(only_ai.piece_sq(Side::Human) == DEFAULT_HUMAN_SQ);
    CHECK(only_ai.piece_sq(Side::Ai) == 10);
    CHECK(only_ai.well_formed());
}

TEST_CASE("a missing piece with no free cell leaves the state malformed") {
    std::vector<int> cells(CELL_COUNT, CELL_DESTROYED);
    cells[20] = CELL_AI;
    State st = State::from_cells(cells);
    CHECK(st.human == 0);
    CHECK(st.ai == sq_bit(20));
    CHECK_FALSE(st.well_formed());
}
