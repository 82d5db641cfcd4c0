#pragma once

#include "engine/isolation/bitboard.hpp"
#include "engine/isolation/iso_state.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace gridduel {
namespace iso {

struct PartitionResult {
    bool is_partitioned = false;
    // Empty cells reachable by each piece; piece squares are not counted.
    int human_region_size = 0;
    int ai_region_size = 0;
    Bitboard human_region = 0;
    Bitboard ai_region = 0;
};

// The pieces are split when no sequence of slides from the human piece ends
// next to the AI piece.
PartitionResult detect_partition(int human_sq, int ai_sq, Bitboard destroyed);

inline PartitionResult detect_partition(const State& st) {
    return detect_partition(st.piece_sq(Side::Human), st.piece_sq(Side::Ai), st.destroyed);
}

bool would_cause_partition(const State& st, int cell);

// Region advantage for the AI (ai - human) if destroying `cell` splits the
// board, 0 when it does not.
int partition_potential(const State& st, int cell);

// Owned by a search call and passed down; never shared between calls.
class CriticalCellCache {
public:
    explicit CriticalCellCache(size_t capacity = 1000) : capacity_(capacity) {}

    const std::vector<int>* find(uint64_t key);
    void insert(uint64_t key, std::vector<int> cells);
    void clear() { map_.clear(); }

    size_t size() const { return map_.size(); }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

    // Exact key: 49 destroyed bits plus both piece squares.
    static uint64_t key_for(const State& st);

private:
    size_t capacity_;
    std::unordered_map<uint64_t, std::vector<int>> map_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

// Empty cells inside the pieces' bounding box (grown by one) whose removal
// would split the board. Empty when the board is already split.
std::vector<int> find_critical_cells(const State& st, CriticalCellCache* cache = nullptr);

} // namespace iso
} // namespace gridduel
