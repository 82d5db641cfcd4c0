#pragma once

#include <cstdint>

namespace gridduel {
namespace iso {

using Bitboard = uint64_t;

static const int BOARD_SIZE = 7;
static const int CELL_COUNT = BOARD_SIZE * BOARD_SIZE;
static const int FLOOD_MAX_ITERATIONS = 50;

static const Bitboard FULL_BOARD = (Bitboard(1) << CELL_COUNT) - 1;
static const Bitboard MASK_COL_0 = 0x0000040810204081ULL; // bits 0,7,...,42
static const Bitboard MASK_COL_6 = 0x0001020408102040ULL; // bits 6,13,...,48
static const Bitboard NOT_COL_0 = FULL_BOARD & ~MASK_COL_0;
static const Bitboard NOT_COL_6 = FULL_BOARD & ~MASK_COL_6;

inline int sq_index(int r, int c) { return r * BOARD_SIZE + c; }
inline int sq_row(int idx) { return idx / BOARD_SIZE; }
inline int sq_col(int idx) { return idx % BOARD_SIZE; }
inline bool on_board(int r, int c) { return r >= 0 && r < BOARD_SIZE && c >= 0 && c < BOARD_SIZE; }
inline Bitboard sq_bit(int idx) { return Bitboard(1) << idx; }

inline int bb_popcount(Bitboard b) { return __builtin_popcountll(b); }
inline int bb_lsb(Bitboard b) { return __builtin_ctzll(b); }

inline int bb_pop_lsb(Bitboard& b) {
    int sq = __builtin_ctzll(b);
    b &= b - 1;
    return sq;
}

// Index of the single set bit, or `fallback` when the mask is empty.
inline int safe_index(Bitboard b, int fallback) {
    b &= FULL_BOARD;
    return b ? bb_lsb(b) : fallback;
}

// Chebyshev (king-step) distance.
inline int king_distance(int a, int b) {
    int dr = sq_row(a) - sq_row(b);
    int dc = sq_col(a) - sq_col(b);
    if (dr < 0) dr = -dr;
    if (dc < 0) dc = -dc;
    return dr > dc ? dr : dc;
}

inline int manhattan_distance(int a, int b) {
    int dr = sq_row(a) - sq_row(b);
    int dc = sq_col(a) - sq_col(b);
    return (dr < 0 ? -dr : dr) + (dc < 0 ? -dc : dc);
}

// Queen slides from every bit in `from` through cells not in `blocked`.
// Bit-parallel over all 8 directions at once.
Bitboard queen_moves_parallel(Bitboard from, Bitboard blocked);

// Reference ray caster for a single square; must agree with the parallel form.
Bitboard queen_moves_ray(int sq, Bitboard blocked);

inline Bitboard queen_moves(int sq, Bitboard blocked) {
    return queen_moves_parallel(sq_bit(sq), blocked);
}

// Cells reachable by any sequence of queen slides from `sq` (excluding `sq`).
Bitboard queen_flood_fill(int sq, Bitboard blocked);

// Same, seeded from a set of squares.
Bitboard queen_flood_fill_from(Bitboard sources, Bitboard blocked);

// Total unobstructed ray length in 8 directions.
int ray_openness(int sq, Bitboard blocked);

} // namespace iso
} // namespace gridduel
