#include "engine/isolation/voronoi.hpp"

namespace gridduel {
namespace iso {

VoronoiResult calculate_voronoi(int human_sq, int ai_sq, Bitboard destroyed) {
    VoronoiResult res;
    Bitboard hbit = sq_bit(human_sq);
    Bitboard abit = sq_bit(ai_sq);
    Bitboard blocked = destroyed | hbit | abit;

    Bitboard h_front = hbit, a_front = abit;
    Bitboard h_seen = hbit, a_seen = abit;

    for (int depth = 0; depth < VORONOI_MAX_DEPTH && (h_front || a_front); depth++) {
        Bitboard h_new = h_front ? queen_moves_parallel(h_front, blocked) & ~h_seen : 0;
        Bitboard a_new = a_front ? queen_moves_parallel(a_front, blocked) & ~a_seen : 0;

        res.human_cells |= h_new & ~a_seen & ~a_new;
        res.ai_cells    |= a_new & ~h_seen & ~h_new;
        res.contested   |= h_new & a_new;

        h_seen |= h_new;
        a_seen |= a_new;
        h_front = h_new;
        a_front = a_new;
    }

    res.human_count = bb_popcount(res.human_cells);
    res.ai_count = bb_popcount(res.ai_cells);
    res.contested_count = bb_popcount(res.contested);
    return res;
}

} // namespace iso
} // namespace gridduel
