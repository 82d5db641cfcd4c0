#include "engine/isolation/evaluation.hpp"

#include "engine/isolation/voronoi.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace gridduel {
namespace iso {

static const double CONTESTED_SHARE = 0.4;
static const double SECOND_MOVE_SHARE = 0.5;
static const double PARTITION_REGION_SCALE = 3.0;
static const double PARTITION_THREAT_SCALE = 0.5;
static const double CRITICAL_CONTROL_SCALE = 2.0;
static const double OPENNESS_SCALE = 0.3;
static const int DESPERATE_MOBILITY = 2;
static const double DESPERATE_MOBILITY_WEIGHT = 50.0;
static const int OPENING_END = 10;
static const int MIDGAME_END = 25;
// Stays clear of the search's mate band.
static const double EVAL_LIMIT = 80000.0;

// ── Position tables ──────────────────────────────────────────────────────
namespace {

struct PositionTables {
    int center[CELL_COUNT];
    int corner[CELL_COUNT];

    PositionTables() {
        const int corners[4] = {sq_index(0, 0), sq_index(0, 6), sq_index(6, 0), sq_index(6, 6)};
        for (int sq = 0; sq < CELL_COUNT; sq++) {
            center[sq] = manhattan_distance(sq, sq_index(3, 3));
            int best = 99;
            for (int c : corners) best = std::min(best, manhattan_distance(sq, c));
            corner[sq] = best;
        }
    }
};

const PositionTables& tables() {
    static const PositionTables t;
    return t;
}

} // namespace

int center_distance(int sq) { return tables().center[sq]; }
int corner_proximity(int sq) { return tables().corner[sq]; }

// ── Weights ──────────────────────────────────────────────────────────────
EvalWeights weights_for_difficulty(int difficulty) {
    EvalWeights w;
    if (difficulty == 7) {
        w.territory = 5.0; w.mobility = 8.0; w.mobility_potential = 5.0;
        w.center = 2.0; w.corner = 3.0; w.partition = 500.0;
        w.critical = 4.0; w.openness = 1.0;
        w.parity = 40.0; w.trap = 150.0; w.effective_mobility = 6.0;
    } else if (difficulty == 3) {
        w.territory = 3.0; w.mobility = 5.0; w.mobility_potential = 2.0;
        w.center = 1.5; w.corner = 2.0; w.partition = 100.0;
        w.critical = 2.0; w.openness = 0.5;
        w.parity = 15.0; w.trap = 50.0; w.effective_mobility = 2.0;
    }
    return w;
}

Phase phase_for(int destroyed_count) {
    if (destroyed_count < OPENING_END) return Phase::Opening;
    if (destroyed_count < MIDGAME_END) return Phase::Midgame;
    return Phase::Endgame;
}

const char* phase_name(Phase p) {
    switch (p) {
    case Phase::Opening: return "opening";
    case Phase::Midgame: return "midgame";
    default:             return "endgame";
    }
}

EvalWeights phase_weights(const EvalWeights& base, int destroyed_count) {
    EvalWeights w = base;
    switch (phase_for(destroyed_count)) {
    case Phase::Opening:
        w.territory *= 0.8;
        w.mobility *= 1.2;
        w.mobility_potential *= 1.2;
        w.center *= 1.5;
        w.partition *= 0.6;
        w.critical *= 0.8;
        w.openness *= 1.5;
        w.parity = 0.0;
        w.effective_mobility = 0.0;
        break;
    case Phase::Midgame:
        w.parity *= 0.5;
        w.effective_mobility = 0.0;
        break;
    case Phase::Endgame:
        w.territory *= 1.5;
        w.mobility_potential *= 0.8;
        w.center *= 0.3;
        w.corner *= 0.5;
        w.partition *= 2.0;
        w.critical *= 1.5;
        w.openness *= 0.5;
        w.trap *= 1.5;
        break;
    }
    return w;
}

// ── Components ───────────────────────────────────────────────────────────
static double mobility_potential(int sq, Bitboard blocked) {
    Bitboard one = queen_moves(sq, blocked);
    Bitboard two = 0;
    Bitboard it = one;
    while (it) {
        int t = bb_pop_lsb(it);
        two |= queen_moves(t, blocked | sq_bit(sq));
    }
    two &= ~one;
    return bb_popcount(one) + bb_popcount(two) * SECOND_MOVE_SHARE;
}

// Landing squares that still leave at least two follow-up slides.
static int effective_mobility(int sq, Bitboard blocked) {
    Bitboard moves = queen_moves(sq, blocked);
    Bitboard vacated = blocked & ~sq_bit(sq);
    int count = 0;
    while (moves) {
        int t = bb_pop_lsb(moves);
        if (bb_popcount(queen_moves(t, vacated | sq_bit(t))) >= 2) count++;
    }
    return count;
}

static double partition_threat(const State& st, const std::vector<int>& critical) {
    double best = -1000.0;
    for (int sq : critical) {
        PartitionResult p = detect_partition(st.piece_sq(Side::Human), st.piece_sq(Side::Ai),
                                             st.destroyed | sq_bit(sq));
        if (p.is_partitioned) best = std::max(best, (double)(p.ai_region_size - p.human_region_size));
    }
    return best * PARTITION_THREAT_SCALE;
}

int evaluate(const State& st, const EvalWeights& base, CriticalCellCache* cache, EvalComponents* out) {
    if (!(st.human & FULL_BOARD) || !(st.ai & FULL_BOARD)) {
        if (out) *out = EvalComponents{};
        return NEUTRAL_SCORE;
    }

    const int hs = bb_lsb(st.human);
    const int as = bb_lsb(st.ai);
    const Bitboard blocked = st.blocked();
    const int destroyed = st.destroyed_count();

    EvalComponents c;
    c.phase = phase_for(destroyed);
    EvalWeights w = phase_weights(base, destroyed);

    PartitionResult part = detect_partition(hs, as, st.destroyed);
    c.partitioned = part.is_partitioned;

    VoronoiResult vor;
    if (part.is_partitioned) {
        c.territory = part.ai_region_size - part.human_region_size;
    } else {
        vor = calculate_voronoi(hs, as, st.destroyed);
        c.territory = (vor.ai_count - vor.human_count) + vor.contested_count * CONTESTED_SHARE;
    }

    int human_mob = bb_popcount(queen_moves(hs, blocked));
    int ai_mob = bb_popcount(queen_moves(as, blocked));
    c.mobility = ai_mob - human_mob;

    if (ai_mob <= DESPERATE_MOBILITY || human_mob <= DESPERATE_MOBILITY) {
        c.desperate = true;
        w.territory = 0.0;
        w.mobility = DESPERATE_MOBILITY_WEIGHT;
        w.partition = 0.0;
    }

    c.mobility_potential = mobility_potential(as, blocked) - mobility_potential(hs, blocked);
    c.center = center_distance(hs) - center_distance(as);
    c.corner = corner_proximity(as) - corner_proximity(hs);

    if (part.is_partitioned) {
        c.partition = (part.ai_region_size - part.human_region_size) * PARTITION_REGION_SCALE;
        c.parity = (part.ai_region_size & 1) - (part.human_region_size & 1);
    } else {
        std::vector<int> critical = find_critical_cells(st, cache);
        if (!critical.empty() && critical.size() <= 3) c.partition = partition_threat(st, critical);

        int ai_ctrl = 0, human_ctrl = 0;
        for (int sq : critical) {
            if (vor.ai_cells & sq_bit(sq)) ai_ctrl++;
            else if (vor.human_cells & sq_bit(sq)) human_ctrl++;
        }
        c.critical = (ai_ctrl - human_ctrl) * CRITICAL_CONTROL_SCALE;
    }

    c.openness = (ray_openness(as, blocked) - ray_openness(hs, blocked)) * OPENNESS_SCALE;
    c.trap = (human_mob == 1 ? 1.0 : 0.0) - (ai_mob == 1 ? 1.0 : 0.0);
    if (c.phase == Phase::Endgame) {
        c.effective_mobility = effective_mobility(as, blocked) - effective_mobility(hs, blocked);
    }

    double score = c.territory * w.territory
                 + c.mobility * w.mobility
                 + c.mobility_potential * w.mobility_potential
                 + c.center * w.center
                 + c.corner * w.corner
                 + c.partition * w.partition
                 + c.critical * w.critical
                 + c.openness * w.openness
                 + c.parity * w.parity
                 + c.trap * w.trap
                 + c.effective_mobility * w.effective_mobility;

    c.total = (int)std::max(-EVAL_LIMIT, std::min(EVAL_LIMIT, score));
    if (out) *out = c;
    return c.total;
}

} // namespace iso
} // namespace gridduel
