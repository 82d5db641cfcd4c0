#pragma once

#include "engine/isolation/bitboard.hpp"
#include "engine/isolation/iso_state.hpp"

namespace gridduel {
namespace iso {

static const int VORONOI_MAX_DEPTH = 20;

struct VoronoiResult {
    Bitboard human_cells = 0;
    Bitboard ai_cells = 0;
    Bitboard contested = 0;
    int human_count = 0;
    int ai_count = 0;
    int contested_count = 0;
};

// Simultaneous two-source BFS over queen-move distance. Cells first reached by
// both frontiers in the same round are contested.
VoronoiResult calculate_voronoi(int human_sq, int ai_sq, Bitboard destroyed);

inline VoronoiResult calculate_voronoi(const State& st) {
    return calculate_voronoi(st.piece_sq(Side::Human), st.piece_sq(Side::Ai), st.destroyed);
}

} // namespace iso
} // namespace gridduel
