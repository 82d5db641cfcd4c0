#pragma once

#include "engine/common/side.hpp"
#include "engine/isolation/bitboard.hpp"

#include <vector>

namespace gridduel {
namespace iso {

static const int DEFAULT_HUMAN_SQ = 0;  // (0,0)
static const int DEFAULT_AI_SQ = 48;    // (6,6)

// Flat-array cell values for Game B.
static const int CELL_EMPTY = 0;
static const int CELL_HUMAN = 1;
static const int CELL_AI = 2;
static const int CELL_DESTROYED = 3;

// Slide to `to`, then remove `destroy`. Indices are r*7+c; -1 means unset.
struct Move {
    int from = -1;
    int to = -1;
    int destroy = -1;

    bool valid() const { return to >= 0; }
    bool operator==(const Move& o) const { return from == o.from && to == o.to && destroy == o.destroy; }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

// Value type; search copies it on every branch.
struct State {
    Bitboard human = 0;
    Bitboard ai = 0;
    Bitboard destroyed = 0;

    static State initial();
    // Clamps coordinates onto the board.
    static State from_raw(int human_r, int human_c, int ai_r, int ai_c,
                          const std::vector<int>& destroyed_cells);
    // Flat 49-cell array; a missing piece falls back to its default square
    // (or the first free cell if that one is taken).
    static State from_cells(const std::vector<int>& cells);

    Bitboard blocked() const { return human | ai | destroyed; }
    Bitboard empty() const { return ~blocked() & FULL_BOARD; }
    Bitboard piece(Side s) const { return s == Side::Human ? human : ai; }
    int piece_sq(Side s) const;

    Bitboard slides(Side s) const { return queen_moves(piece_sq(s), blocked()); }
    int mobility(Side s) const { return bb_popcount(slides(s)); }

    int destroyed_count() const { return bb_popcount(destroyed); }
    int empty_count() const { return bb_popcount(empty()); }

    // Copy with `s` moved to `to` and `destroy` removed (destroy < 0 skips it).
    State apply(Side s, int to, int destroy) const;
    State apply(Side s, const Move& m) const { return apply(s, m.to, m.destroy); }

    // Disjoint masks, exactly one bit per piece.
    bool well_formed() const;
    bool is_legal(Side s, const Move& m) const;
};

} // namespace iso
} // namespace gridduel
