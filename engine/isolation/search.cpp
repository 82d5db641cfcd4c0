#include "engine/isolation/search.hpp"

#include "engine/common/log.hpp"
#include "engine/isolation/endgame.hpp"
#include "engine/isolation/opening.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace gridduel {
namespace iso {

static const int ASPIRATION_WINDOW = 50;
static const int ASPIRATION_MAX = 500;
static const int NULL_MOVE_MIN_DEPTH = 3;
static const int NULL_MOVE_MIN_MOBILITY = 3;
static const int NULL_MOVE_MIN_FREE = 10;
static const int HISTORY_MAX = 32000;

SearchConfig config_for_difficulty(int difficulty) {
    SearchConfig cfg;
    cfg.weights = weights_for_difficulty(difficulty);
    if (difficulty == 7) {
        cfg.max_depth = 10;
        cfg.time_limit_ms = 10000.0;
        cfg.endgame_region_limit = 16;
    } else if (difficulty == 3) {
        cfg.max_depth = 5;
        cfg.time_limit_ms = 3000.0;
        cfg.use_aspiration = false;
        cfg.use_null_move = false;
        cfg.endgame_region_limit = 14;
    } else {
        cfg.max_depth = 7;
        cfg.time_limit_ms = 12000.0;
        cfg.endgame_region_limit = 18;
    }
    return cfg;
}

const char* source_name(MoveSource s) {
    switch (s) {
    case MoveSource::OpeningBook:   return "opening_book";
    case MoveSource::EndgameSolver: return "endgame_solver";
    case MoveSource::Search:        return "search";
    default:                        return "none";
    }
}

Searcher::Searcher(const SearchConfig& cfg, const Clock& clock)
    : cfg_(cfg), clock_(&clock), tt_(cfg.tt_entries) {
    reset_tables();
}

void Searcher::reset_tables() {
    for (int i = 0; i < MAX_PLY; i++) killers_[i][0] = killers_[i][1] = Move{};
    std::memset(history_, 0, sizeof(history_));
    crit_cache_.clear();
}

// ── Destroy candidates ───────────────────────────────────────────────────
int Searcher::destroy_count_for(const State& st) const {
    if (cfg_.destroy_candidates > 0) return cfg_.destroy_candidates;
    int d = st.destroyed_count();
    if (d < 10) return 6;
    if (d < 30) return 8;
    return 12;
}

// Partition effects are left to the leaf evaluation of each child.
int Searcher::score_destroy(const State& moved, Side mover, int cell) const {
    const Side opp = opponent(mover);
    const Bitboard bit = sq_bit(cell);
    const Bitboard opp_moves = moved.slides(opp);
    const Bitboard my_moves = moved.slides(mover);
    const int opp_mob = bb_popcount(opp_moves);
    const int my_mob = bb_popcount(my_moves);

    int s = 0;
    if (opp_mob == 0) s += 20000;
    if (opp_moves & bit) s += (opp_mob == 1) ? 10000 : 50;

    int od = king_distance(cell, moved.piece_sq(opp));
    if (od == 1) s += 30;
    else if (od == 2) s += 15;

    if (king_distance(cell, moved.piece_sq(mover)) == 1) s -= 50;
    if (my_moves & bit) s -= (my_mob <= 1) ? 5000 : 10;

    s += (6 - center_distance(cell)) * 2;
    return s;
}

std::vector<int> Searcher::destroy_candidates(const State& moved, Side mover, int k) const {
    std::vector<std::pair<int, int>> scored;
    Bitboard empty = moved.empty();
    scored.reserve(bb_popcount(empty));
    while (empty) {
        int cell = bb_pop_lsb(empty);
        scored.push_back({score_destroy(moved, mover, cell), cell});
    }
    int n = std::min<int>(k, (int)scored.size());
    std::partial_sort(scored.begin(), scored.begin() + n, scored.end(),
                      [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
                          if (a.first != b.first) return a.first > b.first;
                          return a.second < b.second;
                      });
    std::vector<int> out;
    out.reserve(n);
    for (int i = 0; i < n; i++) out.push_back(scored[i].second);
    return out;
}

// ── Move ordering ────────────────────────────────────────────────────────
void Searcher::order_moves(const State& st, Side mover, int ply, const Move& tt_move,
                           std::vector<Move>& out) const {
    const int from = st.piece_sq(mover);
    const Side opp = opponent(mover);
    const int side = mover == Side::Human ? 0 : 1;

    std::vector<ScoredSlide> slides;
    Bitboard bb = st.slides(mover);
    while (bb) {
        int to = bb_pop_lsb(bb);
        int s = 0;
        if (tt_move.from == from && tt_move.to == to) s += 100000;
        if (cfg_.use_killers && ply < MAX_PLY) {
            if (killers_[ply][0].from == from && killers_[ply][0].to == to) s += 9000;
            else if (killers_[ply][1].from == from && killers_[ply][1].to == to) s += 8000;
        }
        if (cfg_.use_history) s += history_[side][from][to];

        State moved = st.apply(mover, to, -1);
        int opp_mob = moved.mobility(opp);
        int my_mob = moved.mobility(mover);
        if (opp_mob == 0) {
            s += 50000;
        } else if (opp_mob > 1) {
            if (my_mob == 0) s -= 100000;
            else if (my_mob == 1) s -= 20000;
            else if (my_mob == 2) s -= 2000;
        }
        slides.push_back({to, s});
    }
    std::stable_sort(slides.begin(), slides.end(), [](const ScoredSlide& a, const ScoredSlide& b) {
        return a.score > b.score;
    });

    const int k = destroy_count_for(st);
    const bool tt_ok = tt_move.valid() && tt_move.from == from && st.is_legal(mover, tt_move);
    if (tt_ok) out.push_back(tt_move);
    for (const ScoredSlide& sl : slides) {
        State moved = st.apply(mover, sl.to, -1);
        for (int cell : destroy_candidates(moved, mover, k)) {
            Move m;
            m.from = from;
            m.to = sl.to;
            m.destroy = cell;
            if (tt_ok && m == tt_move) continue;
            out.push_back(m);
        }
    }
}

void Searcher::record_cutoff(const Move& m, Side mover, int depth, int ply) {
    if (cfg_.use_killers && ply < MAX_PLY && killers_[ply][0] != m) {
        killers_[ply][1] = killers_[ply][0];
        killers_[ply][0] = m;
    }
    if (cfg_.use_history) {
        int& v = history_[mover == Side::Human ? 0 : 1][m.from][m.to];
        v = std::min(HISTORY_MAX, v + depth * depth);
    }
}

// Passing is only sound while both sides still have room to move.
bool Searcher::null_move_allowed(const State& st, Side mover, int depth, int ply) const {
    if (!cfg_.use_null_move || ply == 0 || depth < NULL_MOVE_MIN_DEPTH) return false;
    if (st.mobility(mover) <= NULL_MOVE_MIN_MOBILITY) return false;
    if (st.empty_count() <= NULL_MOVE_MIN_FREE) return false;
    return st.mobility(opponent(mover)) > 0;
}

// ── Negamax ──────────────────────────────────────────────────────────────
int Searcher::negamax(const State& st, Side mover, uint64_t hash, int depth, int ply,
                      int alpha, int beta, bool allow_null, Move* best_out) {
    nodes_++;
    if (timer_->time_up()) {
        aborted_ = true;
        return aborted_score(mover);
    }

    const Bitboard slides = st.slides(mover);
    if (!slides) return -SCORE_MATE - depth * 100;

    const int alpha0 = alpha;
    Move tt_move;
    if (cfg_.use_tt) {
        if (const TTEntry* e = tt_.probe(hash)) {
            tt_move = e->move();
            if (ply > 0 && e->depth >= depth) {
                if (e->bound == Bound::Exact) return e->score;
                if (e->bound == Bound::Lower && e->score >= beta) return e->score;
                if (e->bound == Bound::Upper && e->score <= alpha) return e->score;
            }
        }
    }

    if (allow_null && null_move_allowed(st, mover, depth, ply)) {
        int r = std::min(3, depth - 1);
        int v = -negamax(st, opponent(mover), zobrist_pass(hash), depth - 1 - r, ply + 1,
                         -beta, -beta + 1, false, nullptr);
        if (aborted_) return aborted_score(mover);
        if (v >= beta) return beta;
    }

    if (depth <= 0) {
        int e = evaluate(st, cfg_.weights, &crit_cache_);
        return mover == Side::Ai ? e : -e;
    }

    std::vector<Move> moves;
    order_moves(st, mover, ply, tt_move, moves);

    const Side opp = opponent(mover);
    Move best;
    int best_score = -SCORE_INF;
    int searched = 0;
    for (const Move& m : moves) {
        State child = st.apply(mover, m);
        uint64_t ch = zobrist_update(hash, mover, m.from, m.to, m.destroy);

        int score;
        if (searched == 0 || !cfg_.use_pvs) {
            score = -negamax(child, opp, ch, depth - 1, ply + 1, -beta, -alpha, true, nullptr);
        } else {
            score = -negamax(child, opp, ch, depth - 1, ply + 1, -alpha - 1, -alpha, true, nullptr);
            if (!aborted_ && score > alpha && score < beta) {
                score = -negamax(child, opp, ch, depth - 1, ply + 1, -beta, -alpha, true, nullptr);
            }
        }
        if (aborted_) {
            if (ply == 0) break;
            return aborted_score(mover);
        }
        searched++;

        if (score > best_score) {
            best_score = score;
            best = m;
        }
        if (score > alpha) alpha = score;
        if (alpha >= beta) {
            record_cutoff(m, mover, depth, ply);
            break;
        }
    }

    if (best_out) *best_out = best;
    if (aborted_) return best_score;

    if (cfg_.use_tt) {
        Bound bound = Bound::Exact;
        if (best_score <= alpha0) bound = Bound::Upper;
        else if (best_score >= beta) bound = Bound::Lower;
        tt_.store(hash, depth, best_score, bound, best);
    }
    return best_score;
}

// Sealed regions: the mover moves first, so it wins only with a strictly
// longer path than the opponent. Returns true once the outcome is proven.
bool Searcher::solve_endgame(const State& st, Side mover, const PartitionResult& part,
                             SearchResult& res, Move& fallback) {
    const int region = mover == Side::Ai ? part.ai_region_size : part.human_region_size;
    if (!cfg_.use_endgame_solver || !part.is_partitioned || region > cfg_.endgame_region_limit)
        return false;

    Deadline budget(*clock_, cfg_.time_limit_ms * 0.5);
    EndgameSolver solver(budget);
    EndgameResult er = solver.solve(st, mover);
    res.nodes += er.nodes;
    if (!er.found) return false;
    fallback = er.move;
    if (er.confidence != Confidence::Exact) return false;

    const PathCheck opp = solver.path_reaches(st, opponent(mover), er.path_length);
    res.nodes = solver.nodes();
    if (opp.verdict == PathVerdict::Unknown) {
        if (log_enabled()) {
            std::cerr << "[iso] endgame unproven path=" << er.path_length
                      << " nodes=" << res.nodes << "\n";
        }
        return false;
    }

    const int diff = er.path_length - opp.length;
    res.found = true;
    res.move = er.move;
    res.score = opp.verdict == PathVerdict::Short ? SCORE_MATE + diff : -(SCORE_MATE - diff);
    res.depth = 255;
    res.solved = true;
    res.source = MoveSource::EndgameSolver;
    if (log_enabled()) {
        std::cerr << "[iso] endgame solved path=" << er.path_length << " opp=" << opp.length
                  << " score=" << res.score << " nodes=" << res.nodes << "\n";
    }
    return true;
}

Move Searcher::fallback_move(const State& st, Side mover) const {
    Move m;
    Bitboard slides = st.slides(mover);
    if (!slides) return m;
    m.from = st.piece_sq(mover);
    m.to = bb_lsb(slides);
    std::vector<int> d = destroy_candidates(st.apply(mover, m.to, -1), mover, 1);
    m.destroy = d.empty() ? -1 : d[0];
    return m;
}

// ── Root ─────────────────────────────────────────────────────────────────
SearchResult Searcher::search(const State& st, Side mover) {
    Deadline deadline(*clock_, cfg_.time_limit_ms);
    SearchResult res;
    root_mover_ = mover;

    PartitionResult part = detect_partition(st);
    res.partitioned = part.is_partitioned;
    if (!st.slides(mover)) {
        res.elapsed_ms = deadline.elapsed_ms();
        return res;
    }

    if (cfg_.use_opening_book) {
        OpeningChoice oc = opening_move(st, mover);
        if (oc.found) {
            res.found = true;
            res.move = oc.move;
            res.score = oc.score;
            res.source = MoveSource::OpeningBook;
            res.elapsed_ms = deadline.elapsed_ms();
            return res;
        }
    }

    Move fallback = fallback_move(st, mover);
    if (solve_endgame(st, mover, part, res, fallback)) {
        res.elapsed_ms = deadline.elapsed_ms();
        return res;
    }

    reset_tables();
    tt_.new_search();
    NodeTimer timer(deadline, cfg_.time_check_interval);
    timer_ = &timer;
    nodes_ = 0;
    aborted_ = false;

    const uint64_t hash = zobrist_hash(st, mover);
    Move best;
    int best_score = 0;
    int completed = 0;
    int prev = 0;

    for (int depth = 1; depth <= cfg_.max_depth; depth++) {
        Move iter;
        int score;
        if (cfg_.use_aspiration && depth >= 3) {
            int window = ASPIRATION_WINDOW;
            for (;;) {
                int a = prev - window, b = prev + window;
                score = negamax(st, mover, hash, depth, 0, a, b, false, &iter);
                if (aborted_ || (score > a && score < b)) break;
                window *= 2;
                if (window > ASPIRATION_MAX) {
                    score = negamax(st, mover, hash, depth, 0, -SCORE_INF, SCORE_INF, false, &iter);
                    break;
                }
            }
        } else {
            score = negamax(st, mover, hash, depth, 0, -SCORE_INF, SCORE_INF, false, &iter);
        }

        if (aborted_) {
            // Only the first depth may contribute a partial answer.
            if (completed == 0 && iter.valid()) {
                best = iter;
                best_score = score;
                completed = 1;
            }
            break;
        }

        best = iter;
        best_score = score;
        prev = score;
        completed = depth;
        if (log_enabled()) {
            std::cerr << "[iso] depth=" << depth << " score=" << score
                      << " nodes=" << nodes_ << " ms=" << deadline.elapsed_ms() << "\n";
        }
        if (std::abs(score) > SCORE_SOLVED) break;
        if (deadline.expired()) break;
    }
    timer_ = nullptr;

    if (!best.valid()) {
        best = fallback;
        completed = 0;
    }

    res.found = best.valid();
    res.move = best;
    res.score = best_score;
    res.depth = completed;
    res.nodes += nodes_;
    res.solved = completed > 0 && std::abs(best_score) > SCORE_SOLVED;
    res.source = MoveSource::Search;
    res.tt_hit_rate = tt_.hit_rate();
    res.elapsed_ms = deadline.elapsed_ms();
    return res;
}

} // namespace iso
} // namespace gridduel
