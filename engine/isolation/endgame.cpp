#include "engine/isolation/endgame.hpp"

#include <algorithm>
#include <climits>

namespace gridduel {
namespace iso {

static const double TIME_FRACTION = 0.8;
static const uint64_t CLOCK_CHECK_MASK = 1023;

int estimate_longest_path(int region_cells) {
    return (int)(region_cells * 0.75);
}

bool should_solve_exactly(int region_cells) {
    return region_cells <= EXACT_REGION_LIMIT;
}

int EndgameSolver::search(int sq, Bitboard visited, int steps) {
    if (halted()) return 0;
    if ((++nodes_ & CLOCK_CHECK_MASK) == 0 && deadline_->past(TIME_FRACTION)) {
        timed_out_ = true;
        return 0;
    }

    uint64_t key = (visited & FULL_BOARD) | (uint64_t(sq) << 49);
    auto it = memo_.find(key);
    if (it != memo_.end()) {
        if (steps + it->second >= target_) reached_ = true;
        return it->second;
    }

    // Fewest onward slides first, so long chains turn up early.
    const Bitboard blocked = ~region_ | visited;
    int order[CELL_COUNT];
    int degree[CELL_COUNT];
    int n = 0;
    Bitboard moves = queen_moves(sq, blocked);
    while (moves) {
        int t = bb_pop_lsb(moves);
        int d = bb_popcount(queen_moves(t, blocked | sq_bit(t)));
        int i = n++;
        while (i > 0 && degree[i - 1] > d) {
            order[i] = order[i - 1];
            degree[i] = degree[i - 1];
            i--;
        }
        order[i] = t;
        degree[i] = d;
    }

    int best = 0;
    for (int i = 0; i < n; i++) {
        int t = order[i];
        best = std::max(best, 1 + search(t, visited | sq_bit(t), steps + 1));
        if (halted()) return best;
    }
    if (memo_.size() >= MEMO_LIMIT) {
        memo_full_ = true;
        return best;
    }
    memo_.emplace(key, best);
    if (steps + best >= target_) reached_ = true;
    return best;
}

void EndgameSolver::start(const State& st, Side side, int target) {
    region_ = queen_flood_fill(st.piece_sq(side), st.blocked());
    memo_.clear();
    target_ = target;
    timed_out_ = false;
    memo_full_ = false;
    reached_ = false;
}

int EndgameSolver::longest_path(const State& st, Side mover) {
    int sq = st.piece_sq(mover);
    start(st, mover, INT_MAX);
    return search(sq, sq_bit(sq), 0);
}

PathCheck EndgameSolver::path_reaches(const State& st, Side side, int target) {
    PathCheck out;
    int sq = st.piece_sq(side);
    start(st, side, target);
    int len = search(sq, sq_bit(sq), 0);
    if (reached_) {
        out.verdict = PathVerdict::Reaches;
        out.length = len;
    } else if (!timed_out_ && !memo_full_) {
        out.verdict = PathVerdict::Short;
        out.length = len;
    }
    return out;
}

// Prefer cells we cannot use anyway, far from us and close to the opponent.
int EndgameSolver::choose_destroy(const State& moved, Side mover, Bitboard region) const {
    const int me = moved.piece_sq(mover);
    const int opp = moved.piece_sq(opponent(mover));
    int best = -1;
    int best_score = INT_MIN;
    Bitboard empty = moved.empty();
    while (empty) {
        int cell = bb_pop_lsb(empty);
        int score = 0;
        if (!(region & sq_bit(cell))) score += 200;
        score += king_distance(cell, me) * 5;
        score += (10 - king_distance(cell, opp)) * 3;
        if (score > best_score) {
            best_score = score;
            best = cell;
        }
    }
    return best;
}

EndgameResult EndgameSolver::solve(const State& st, Side mover) {
    EndgameResult res;
    const int from = st.piece_sq(mover);
    start(st, mover, INT_MAX);
    nodes_ = 0;

    Bitboard moves = st.slides(mover);
    int best_to = -1;
    int best_len = -1;
    while (moves) {
        if (deadline_->past(TIME_FRACTION)) {
            timed_out_ = true;
            break;
        }
        int t = bb_pop_lsb(moves);
        int len = 1 + search(t, sq_bit(from) | sq_bit(t), 1);
        if (halted()) break;
        if (len > best_len) {
            best_len = len;
            best_to = t;
        }
    }

    // A timed-out or memo-capped solve still answers with the best slide seen so far.
    if (best_to < 0) {
        Bitboard all = st.slides(mover);
        if (!all) return res;
        best_to = bb_lsb(all);
        best_len = 1;
    }

    State moved = st.apply(mover, best_to, -1);
    res.found = true;
    res.move.from = from;
    res.move.to = best_to;
    res.move.destroy = choose_destroy(moved, mover, region_);
    res.path_length = best_len;
    res.confidence = (timed_out_ || memo_full_) ? Confidence::Heuristic : Confidence::Exact;
    res.nodes = nodes_;
    return res;
}

} // namespace iso
} // namespace gridduel
