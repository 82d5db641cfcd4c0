#pragma once

#include "engine/common/clock.hpp"
#include "engine/isolation/evaluation.hpp"
#include "engine/isolation/iso_state.hpp"
#include "engine/isolation/partition.hpp"
#include "engine/isolation/transposition.hpp"

#include <cstdint>
#include <vector>

namespace gridduel {
namespace iso {

static const int SCORE_INF = 1000000;
static const int SCORE_MATE = 100000;
static const int SCORE_SOLVED = 90000;
static const int MAX_PLY = 64;

struct SearchConfig {
    int max_depth = 7;
    double time_limit_ms = 12000.0;
    EvalWeights weights;

    bool use_tt = true;
    bool use_killers = true;
    bool use_history = true;
    bool use_aspiration = true;
    bool use_pvs = true;
    bool use_null_move = true;
    bool use_opening_book = true;
    bool use_endgame_solver = true;

    int endgame_region_limit = 18;
    // Destroy cells expanded per slide; 0 picks 6/8/12 by phase.
    int destroy_candidates = 0;
    // Nodes between clock reads; power of two.
    uint32_t time_check_interval = 256;
    size_t tt_entries = 500000;
};

// Difficulty 3 / 5 / 7; unknown codes use 5.
SearchConfig config_for_difficulty(int difficulty);

enum class MoveSource { None, OpeningBook, EndgameSolver, Search };
const char* source_name(MoveSource s);

struct SearchResult {
    bool found = false;
    Move move;
    int score = 0;        // mover's point of view
    int depth = 0;        // 255 when the endgame solver proved the outcome
    uint64_t nodes = 0;
    double elapsed_ms = 0.0;
    bool solved = false;
    bool partitioned = false;
    MoveSource source = MoveSource::None;
    double tt_hit_rate = 0.0;
};

// One top-level search. Tables live on the object and are reset per call.
class Searcher {
public:
    explicit Searcher(const SearchConfig& cfg, const Clock& clock = default_clock());

    SearchResult search(const State& st, Side mover);

    // Top-k destroy cells after `mover` has already slid in `moved`.
    std::vector<int> destroy_candidates(const State& moved, Side mover, int k) const;
    int destroy_count_for(const State& st) const;

    // Cutoff bookkeeping: two killer slots per ply, most recent first, and a
    // depth-squared history bonus per (side, from, to).
    void record_cutoff(const Move& m, Side mover, int depth, int ply);
    const Move& killer(int ply, int slot) const { return killers_[ply][slot]; }
    int history_score(Side mover, int from, int to) const {
        return history_[mover == Side::Human ? 0 : 1][from][to];
    }

    bool null_move_allowed(const State& st, Side mover, int depth, int ply) const;

    const TranspositionTable& tt() const { return tt_; }

private:
    struct ScoredSlide {
        int to;
        int score;
    };

    int negamax(const State& st, Side mover, uint64_t hash, int depth, int ply,
                int alpha, int beta, bool allow_null, Move* best_out);
    void order_moves(const State& st, Side mover, int ply, const Move& tt_move,
                     std::vector<Move>& out) const;
    int score_destroy(const State& moved, Side mover, int cell) const;
    bool solve_endgame(const State& st, Side mover, const PartitionResult& part,
                       SearchResult& res, Move& fallback);
    int aborted_score(Side mover) const { return mover == root_mover_ ? -SCORE_INF : SCORE_INF; }
    Move fallback_move(const State& st, Side mover) const;
    void reset_tables();

    SearchConfig cfg_;
    const Clock* clock_;
    TranspositionTable tt_;
    CriticalCellCache crit_cache_;
    Move killers_[MAX_PLY][2];
    int history_[2][CELL_COUNT][CELL_COUNT];

    NodeTimer* timer_ = nullptr;
    Side root_mover_ = Side::Ai;
    uint64_t nodes_ = 0;
    bool aborted_ = false;
};

} // namespace iso
} // namespace gridduel
