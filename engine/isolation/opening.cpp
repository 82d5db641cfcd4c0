#include "engine/isolation/opening.hpp"

#include <climits>
#include <cstdlib>

namespace gridduel {
namespace iso {

static const int CENTER_WEIGHT = 10;
static const int MOBILITY_WEIGHT = 5;
static const int CORNER_PENALTY = 15;
static const int EDGE_PENALTY = 5;
static const int CENTER_SQ = 24; // (3,3)

static bool is_corner(int sq) {
    int r = sq_row(sq), c = sq_col(sq);
    return (r == 0 || r == BOARD_SIZE - 1) && (c == 0 || c == BOARD_SIZE - 1);
}

static bool is_edge(int sq) {
    int r = sq_row(sq), c = sq_col(sq);
    return r == 0 || r == BOARD_SIZE - 1 || c == 0 || c == BOARD_SIZE - 1;
}

// Central cell close enough to be part of our own working space.
static bool center_cell_near(int cell, int me) {
    return manhattan_distance(cell, CENTER_SQ) <= 1 && manhattan_distance(cell, me) <= 2;
}

bool is_opening_phase(int turn, int destroyed_count) {
    return turn <= 12 && destroyed_count <= OPENING_PLIES;
}

int score_opening_slide(const State& st, Side mover, int to) {
    const int from = st.piece_sq(mover);
    const int opp = st.piece_sq(opponent(mover));
    const int turn = st.destroyed_count();
    const int r = sq_row(to), c = sq_col(to);

    int score = -manhattan_distance(to, CENTER_SQ) * CENTER_WEIGHT;
    if (r >= 2 && r <= 4 && c >= 2 && c <= 4) score += 20;

    if (is_corner(to)) score -= CORNER_PENALTY * 3;
    else if (is_edge(to)) score -= EDGE_PENALTY;

    State moved = st.apply(mover, to, -1);
    score += moved.mobility(mover) * MOBILITY_WEIGHT;

    int d = manhattan_distance(to, opp);
    if (turn <= 6) {
        if (d < 2) score -= 10;
        else if (d >= 3 && d <= 5) score += 5;
    } else if (d <= 4) {
        score += 3;
    }

    if (sq_row(from) != r && sq_col(from) != c) score += 3;
    if (r == c || r + c == BOARD_SIZE - 1) score += 5;
    return score;
}

int score_opening_destroy(const State& moved, Side mover, int cell) {
    const int me = moved.piece_sq(mover);
    const int opp = moved.piece_sq(opponent(mover));
    const Bitboard bit = sq_bit(cell);
    int score = 0;

    int d = manhattan_distance(cell, opp);
    if (d == 1) score += 50;
    else if (d == 2) score += 25;

    // On a shortest path between the opponent and the centre.
    if (d + manhattan_distance(cell, CENTER_SQ) == manhattan_distance(opp, CENTER_SQ)) score += 30;

    if (moved.slides(opponent(mover)) & bit) score += 35;
    if (moved.slides(mover) & bit) score -= 20;
    if (center_cell_near(cell, me)) score -= 15;

    if (is_corner(cell)) score += 5;
    else if (is_edge(cell)) score += 2;
    return score;
}

OpeningChoice opening_move(const State& st, Side mover) {
    OpeningChoice out;
    // Every ply destroys one cell, so the destroyed count is also the turn.
    if (!is_opening_phase(st.destroyed_count(), st.destroyed_count())) return out;

    int best_to = -1;
    int best_score = INT_MIN;
    Bitboard slides = st.slides(mover);
    while (slides) {
        int to = bb_pop_lsb(slides);
        if (st.apply(mover, to, -1).mobility(mover) == 0) continue;
        int s = score_opening_slide(st, mover, to);
        if (s > best_score) {
            best_score = s;
            best_to = to;
        }
    }
    if (best_to < 0) return out;

    State moved = st.apply(mover, best_to, -1);
    int best_destroy = -1;
    int best_destroy_score = INT_MIN;
    Bitboard empty = moved.empty();
    while (empty) {
        int cell = bb_pop_lsb(empty);
        if (moved.apply(mover, best_to, cell).mobility(mover) == 0) continue;
        int s = score_opening_destroy(moved, mover, cell);
        if (s > best_destroy_score) {
            best_destroy_score = s;
            best_destroy = cell;
        }
    }
    if (best_destroy < 0) return out;

    out.found = true;
    out.move.from = st.piece_sq(mover);
    out.move.to = best_to;
    out.move.destroy = best_destroy;
    out.score = best_score;
    return out;
}

} // namespace iso
} // namespace gridduel
