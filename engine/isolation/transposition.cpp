#include "engine/isolation/transposition.hpp"

namespace gridduel {
namespace iso {

// ── Zobrist keys ─────────────────────────────────────────────────────────
namespace {

uint64_t splitmix64_next(uint64_t& x) {
    x += 0x9E3779B97F4A7C15ULL;
    uint64_t z = x;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

struct ZobristKeys {
    uint64_t human[CELL_COUNT];
    uint64_t ai[CELL_COUNT];
    uint64_t destroyed[CELL_COUNT];
    uint64_t ai_to_move;

    ZobristKeys() {
        uint64_t seed = 0xC0FFEE1234567890ULL;
        for (int sq = 0; sq < CELL_COUNT; sq++) human[sq] = splitmix64_next(seed);
        for (int sq = 0; sq < CELL_COUNT; sq++) ai[sq] = splitmix64_next(seed);
        for (int sq = 0; sq < CELL_COUNT; sq++) destroyed[sq] = splitmix64_next(seed);
        ai_to_move = splitmix64_next(seed);
    }

    const uint64_t* piece(Side s) const { return s == Side::Human ? human : ai; }
};

const ZobristKeys& keys() {
    static const ZobristKeys k;
    return k;
}

} // namespace

uint64_t zobrist_hash(const State& st, Side to_move) {
    const ZobristKeys& k = keys();
    uint64_t h = 0;
    h ^= k.human[st.piece_sq(Side::Human)];
    h ^= k.ai[st.piece_sq(Side::Ai)];
    Bitboard d = st.destroyed & FULL_BOARD;
    while (d) h ^= k.destroyed[bb_pop_lsb(d)];
    if (to_move == Side::Ai) h ^= k.ai_to_move;
    return h;
}

uint64_t zobrist_update(uint64_t h, Side mover, int from, int to, int destroy) {
    const ZobristKeys& k = keys();
    const uint64_t* pk = k.piece(mover);
    h ^= pk[from] ^ pk[to];
    if (destroy >= 0) h ^= k.destroyed[destroy];
    return h ^ k.ai_to_move;
}

uint64_t zobrist_pass(uint64_t h) {
    return h ^ keys().ai_to_move;
}

// ── Transposition table ──────────────────────────────────────────────────
TranspositionTable::TranspositionTable(size_t max_entries) {
    size_t want = max_entries / BUCKET;
    size_t n = 1;
    while (n * 2 <= want) n *= 2;
    clusters_.resize(n);
    mask_ = n - 1;
}

bool TranspositionTable::stale(const TTEntry& e) const {
    return uint8_t(generation_ - e.generation) > 2;
}

const TTEntry* TranspositionTable::probe(uint64_t key) {
    const Cluster& c = clusters_[key & mask_];
    const TTEntry* dp = &c.e[0];
    const TTEntry* ar = &c.e[1];
    bool dp_hit = dp->key == key && dp->depth >= 0;
    bool ar_hit = ar->key == key && ar->depth >= 0;
    if (dp_hit && ar_hit) {
        hits_++;
        bool dp_current = dp->generation == generation_;
        bool ar_current = ar->generation == generation_;
        if (dp_current != ar_current) return dp_current ? dp : ar;
        return dp->depth >= ar->depth ? dp : ar;
    }
    if (dp_hit || ar_hit) {
        hits_++;
        return dp_hit ? dp : ar;
    }
    misses_++;
    return nullptr;
}

void TranspositionTable::store(uint64_t key, int depth, int score, Bound bound, const Move& best) {
    Cluster& c = clusters_[key & mask_];
    auto write_entry = [&](TTEntry& e) {
        e.key = key;
        e.depth = (int16_t)depth;
        e.score = score;
        e.bound = bound;
        e.generation = generation_;
        e.from = (int8_t)best.from;
        e.to = (int8_t)best.to;
        e.destroy = (int8_t)best.destroy;
    };

    TTEntry& depth_slot = c.e[0];
    if (depth_slot.depth < 0 || stale(depth_slot) || depth > depth_slot.depth ||
        (depth == depth_slot.depth && (bound == Bound::Exact || depth_slot.key != key))) {
        write_entry(depth_slot);
        return;
    }
    if (depth_slot.key == key) return;

    write_entry(c.e[1]);
}

void TranspositionTable::new_search() {
    generation_++;
    hits_ = 0;
    misses_ = 0;
}

void TranspositionTable::clear() {
    for (Cluster& c : clusters_) {
        c.e[0] = TTEntry{};
        c.e[1] = TTEntry{};
    }
    generation_ = 0;
    hits_ = 0;
    misses_ = 0;
}

} // namespace iso
} // namespace gridduel
