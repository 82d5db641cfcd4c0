#include "engine/isolation/bitboard.hpp"

namespace gridduel {
namespace iso {

static const int QUEEN_DIRS[8][2] = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1},
};

// ── Direction shifts ─────────────────────────────────────────────────────
// Row grows with the bit index: north (+row) is <<7.
static inline Bitboard shift_n(Bitboard b)  { return (b << 7) & FULL_BOARD; }
static inline Bitboard shift_s(Bitboard b)  { return b >> 7; }
static inline Bitboard shift_e(Bitboard b)  { return (b << 1) & NOT_COL_0; }
static inline Bitboard shift_w(Bitboard b)  { return (b >> 1) & NOT_COL_6; }
static inline Bitboard shift_ne(Bitboard b) { return (b << 8) & NOT_COL_0; }
static inline Bitboard shift_nw(Bitboard b) { return (b << 6) & NOT_COL_6; }
static inline Bitboard shift_se(Bitboard b) { return (b >> 6) & NOT_COL_0; }
static inline Bitboard shift_sw(Bitboard b) { return (b >> 8) & NOT_COL_6; }

template <Bitboard (*Shift)(Bitboard)>
static inline Bitboard slide(Bitboard from, Bitboard empty) {
    Bitboard out = 0;
    Bitboard ray = Shift(from) & empty;
    for (int i = 0; i < BOARD_SIZE - 1 && ray; i++) {
        out |= ray;
        ray = Shift(ray) & empty;
    }
    return out;
}

Bitboard queen_moves_parallel(Bitboard from, Bitboard blocked) {
    Bitboard empty = ~blocked & FULL_BOARD;
    from &= FULL_BOARD;
    return slide<shift_n>(from, empty)  | slide<shift_s>(from, empty)
         | slide<shift_e>(from, empty)  | slide<shift_w>(from, empty)
         | slide<shift_ne>(from, empty) | slide<shift_nw>(from, empty)
         | slide<shift_se>(from, empty) | slide<shift_sw>(from, empty);
}

Bitboard queen_moves_ray(int sq, Bitboard blocked) {
    Bitboard out = 0;
    int r0 = sq_row(sq), c0 = sq_col(sq);
    for (const auto& d : QUEEN_DIRS) {
        int r = r0 + d[0], c = c0 + d[1];
        while (on_board(r, c)) {
            Bitboard bit = sq_bit(sq_index(r, c));
            if (blocked & bit) break;
            out |= bit;
            r += d[0];
            c += d[1];
        }
    }
    return out;
}

Bitboard queen_flood_fill_from(Bitboard sources, Bitboard blocked) {
    Bitboard reached = 0;
    Bitboard frontier = sources & FULL_BOARD;
    for (int i = 0; i < FLOOD_MAX_ITERATIONS && frontier; i++) {
        Bitboard next = queen_moves_parallel(frontier, blocked | reached | sources);
        frontier = next & ~reached;
        reached |= frontier;
    }
    return reached;
}

Bitboard queen_flood_fill(int sq, Bitboard blocked) {
    return queen_flood_fill_from(sq_bit(sq), blocked);
}

int ray_openness(int sq, Bitboard blocked) {
    return bb_popcount(queen_moves(sq, blocked));
}

} // namespace iso
} // namespace gridduel
