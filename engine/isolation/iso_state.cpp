#include "engine/isolation/iso_state.hpp"

#include <algorithm>

namespace gridduel {
namespace iso {

State State::initial() {
    State st;
    st.human = sq_bit(DEFAULT_HUMAN_SQ);
    st.ai = sq_bit(DEFAULT_AI_SQ);
    return st;
}

static int clamp_coord(int v) {
    return std::max(0, std::min(BOARD_SIZE - 1, v));
}

State State::from_raw(int human_r, int human_c, int ai_r, int ai_c,
                      const std::vector<int>& destroyed_cells) {
    State st;
    st.human = sq_bit(sq_index(clamp_coord(human_r), clamp_coord(human_c)));
    st.ai = sq_bit(sq_index(clamp_coord(ai_r), clamp_coord(ai_c)));
    for (int idx : destroyed_cells) {
        if (idx >= 0 && idx < CELL_COUNT) st.destroyed |= sq_bit(idx);
    }
    st.destroyed &= ~(st.human | st.ai);
    return st;
}

// -1 when every cell is taken.
static int first_free(Bitboard taken, int preferred) {
    if (!(taken & sq_bit(preferred))) return preferred;
    Bitboard free_cells = ~taken & FULL_BOARD;
    return free_cells ? bb_lsb(free_cells) : -1;
}

State State::from_cells(const std::vector<int>& cells) {
    State st;
    int n = std::min<int>((int)cells.size(), CELL_COUNT);
    for (int i = 0; i < n; i++) {
        Bitboard bit = sq_bit(i);
        switch (cells[i]) {
        case CELL_HUMAN:
            if (!st.human) st.human = bit;
            break;
        case CELL_AI:
            if (!st.ai) st.ai = bit;
            break;
        case CELL_DESTROYED:
            st.destroyed |= bit;
            break;
        default:
            break;
        }
    }
    // A piece with nowhere to go stays off the board; well_formed() reports it.
    if (!st.human) {
        int sq = first_free(st.ai | st.destroyed, DEFAULT_HUMAN_SQ);
        if (sq >= 0) st.human = sq_bit(sq);
    }
    if (!st.ai) {
        int sq = first_free(st.human | st.destroyed, DEFAULT_AI_SQ);
        if (sq >= 0) st.ai = sq_bit(sq);
    }
    return st;
}

int State::piece_sq(Side s) const {
    return s == Side::Human ? safe_index(human, DEFAULT_HUMAN_SQ)
                            : safe_index(ai, DEFAULT_AI_SQ);
}

State State::apply(Side s, int to, int destroy) const {
    State next = *this;
    Bitboard to_bit = sq_bit(to);
    if (s == Side::Human) next.human = to_bit;
    else next.ai = to_bit;
    if (destroy >= 0 && destroy < CELL_COUNT) next.destroyed |= sq_bit(destroy);
    return next;
}

bool State::well_formed() const {
    if (bb_popcount(human) != 1 || bb_popcount(ai) != 1) return false;
    if ((human & ai) || (human & destroyed) || (ai & destroyed)) return false;
    return (blocked() & ~FULL_BOARD) == 0;
}

bool State::is_legal(Side s, const Move& m) const {
    if (m.to < 0 || m.to >= CELL_COUNT) return false;
    if (!(slides(s) & sq_bit(m.to))) return false;
    if (m.destroy < 0) return true;
    if (m.destroy >= CELL_COUNT || m.destroy == m.to) return false;
    State moved = apply(s, m.to, -1);
    return (moved.empty() & sq_bit(m.destroy)) != 0;
}

} // namespace iso
} // namespace gridduel
