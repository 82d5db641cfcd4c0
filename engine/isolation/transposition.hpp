#pragma once

#include "engine/isolation/iso_state.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gridduel {
namespace iso {

// ── Zobrist keys ─────────────────────────────────────────────────────────
// Full hash of a position with `to_move` about to play.
uint64_t zobrist_hash(const State& st, Side to_move);

// Hash after `mover` slides from -> to and destroys `destroy` (< 0 for none).
// The side to move flips.
uint64_t zobrist_update(uint64_t h, Side mover, int from, int to, int destroy);

// Hash after a passed turn (null move).
uint64_t zobrist_pass(uint64_t h);

// ── Transposition table ──────────────────────────────────────────────────
enum class Bound : uint8_t { Exact = 0, Lower = 1, Upper = 2 };

struct TTEntry {
    uint64_t key = 0;
    int32_t score = 0;
    int16_t depth = -1;
    Bound bound = Bound::Exact;
    uint8_t generation = 0;
    int8_t from = -1;
    int8_t to = -1;
    int8_t destroy = -1;

    Move move() const {
        Move m;
        m.from = from;
        m.to = to;
        m.destroy = destroy;
        return m;
    }
};

// Clusters of two entries: slot 0 keeps the deeper/fresher result, slot 1 is
// always overwritten. Entries older than two generations are fair game.
class TranspositionTable {
public:
    explicit TranspositionTable(size_t max_entries = 500000);

    // Entry for `key` or nullptr. Callers decide whether depth/bound suffice.
    const TTEntry* probe(uint64_t key);
    void store(uint64_t key, int depth, int score, Bound bound, const Move& best);

    void new_search();
    void clear();

    uint8_t generation() const { return generation_; }
    size_t capacity() const { return clusters_.size() * BUCKET; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    double hit_rate() const {
        uint64_t n = hits_ + misses_;
        return n ? (double)hits_ / n : 0.0;
    }

private:
    static const int BUCKET = 2;
    struct Cluster { TTEntry e[BUCKET]; };

    bool stale(const TTEntry& e) const;

    std::vector<Cluster> clusters_;
    size_t mask_ = 0;
    uint8_t generation_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace iso
} // namespace gridduel
