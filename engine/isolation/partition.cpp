#include "engine/isolation/partition.hpp"

#include <algorithm>

namespace gridduel {
namespace iso {

PartitionResult detect_partition(int human_sq, int ai_sq, Bitboard destroyed) {
    PartitionResult res;
    Bitboard hbit = sq_bit(human_sq);
    Bitboard abit = sq_bit(ai_sq);

    Bitboard human_reach = queen_flood_fill(human_sq, destroyed | abit);
    Bitboard touch = queen_moves_parallel(human_reach | hbit, destroyed);
    res.is_partitioned = (touch & abit) == 0;

    res.human_region = human_reach;
    res.ai_region = res.is_partitioned ? queen_flood_fill(ai_sq, destroyed | hbit) : human_reach;
    res.human_region_size = bb_popcount(res.human_region);
    res.ai_region_size = bb_popcount(res.ai_region);
    return res;
}

bool would_cause_partition(const State& st, int cell) {
    Bitboard bit = sq_bit(cell);
    if (st.blocked() & bit) return false;
    return detect_partition(st.piece_sq(Side::Human), st.piece_sq(Side::Ai),
                            st.destroyed | bit).is_partitioned;
}

int partition_potential(const State& st, int cell) {
    Bitboard bit = sq_bit(cell);
    if (st.blocked() & bit) return 0;
    PartitionResult p = detect_partition(st.piece_sq(Side::Human), st.piece_sq(Side::Ai),
                                         st.destroyed | bit);
    if (!p.is_partitioned) return 0;
    return p.ai_region_size - p.human_region_size;
}

// ── Critical-cell cache ──────────────────────────────────────────────────
uint64_t CriticalCellCache::key_for(const State& st) {
    return (st.destroyed & FULL_BOARD)
         | (uint64_t(st.piece_sq(Side::Human)) << 49)
         | (uint64_t(st.piece_sq(Side::Ai)) << 55);
}

const std::vector<int>* CriticalCellCache::find(uint64_t key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        misses_++;
        return nullptr;
    }
    hits_++;
    return &it->second;
}

void CriticalCellCache::insert(uint64_t key, std::vector<int> cells) {
    if (map_.size() >= capacity_) map_.clear();
    map_[key] = std::move(cells);
}

std::vector<int> find_critical_cells(const State& st, CriticalCellCache* cache) {
    uint64_t key = 0;
    if (cache) {
        key = CriticalCellCache::key_for(st);
        if (const std::vector<int>* hit = cache->find(key)) return *hit;
    }

    std::vector<int> out;
    int hs = st.piece_sq(Side::Human), as = st.piece_sq(Side::Ai);
    if (!detect_partition(hs, as, st.destroyed).is_partitioned) {
        int r0 = std::max(0, std::min(sq_row(hs), sq_row(as)) - 1);
        int r1 = std::min(BOARD_SIZE - 1, std::max(sq_row(hs), sq_row(as)) + 1);
        int c0 = std::max(0, std::min(sq_col(hs), sq_col(as)) - 1);
        int c1 = std::min(BOARD_SIZE - 1, std::max(sq_col(hs), sq_col(as)) + 1);
        Bitboard empty = st.empty();
        for (int r = r0; r <= r1; r++) {
            for (int c = c0; c <= c1; c++) {
                int sq = sq_index(r, c);
                if (!(empty & sq_bit(sq))) continue;
                if (detect_partition(hs, as, st.destroyed | sq_bit(sq)).is_partitioned) out.push_back(sq);
            }
        }
    }

    if (cache) cache->insert(key, out);
    return out;
}

} // namespace iso
} // namespace gridduel
