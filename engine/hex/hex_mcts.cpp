#include "engine/hex/hex_mcts.hpp"

#include "engine/common/log.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace gridduel {
namespace hex {

static const double UNVISITED_EXPLORE = 1e6;
static const double MIN_TEMPERATURE = 1e-3;
static const int TOP_CANDIDATES = 5;
static const int CENTER = BOARD_SIZE / 2;

MctsConfig config_for_difficulty(int difficulty) {
    MctsConfig cfg;
    switch (difficulty) {
    case 3:
        cfg.max_simulations = 30000;
        cfg.playout_heuristic_chance = 0.05;
        cfg.selection_temperature = 0.5;
        break;
    case 5:
        cfg.max_simulations = 80000;
        cfg.playout_heuristic_chance = 0.15;
        cfg.selection_temperature = 0.1;
        break;
    default:
        cfg.max_simulations = 1000000;
        cfg.playout_heuristic_chance = 0.30;
        cfg.selection_temperature = 0.0;
        break;
    }
    return cfg;
}

Mcts::Mcts(const HexState& root, Side to_move, const MctsConfig& cfg, const Clock& clock)
    : root_state_(root), root_to_move_(to_move), cfg_(cfg), clock_(&clock), rng_(make_rng(cfg.seed)) {
    nodes_.reserve(4096);
    Node r;
    r.mover = opponent(to_move);
    r.terminal = root_state_.winner() != Side::None;
    if (!r.terminal) r.untried = root_state_.empty_cells();
    nodes_.push_back(std::move(r));
}

// ── Selection ────────────────────────────────────────────────────────────
double Mcts::selection_score(const Node& parent, const Node& child) const {
    if (child.visits == 0) return 0.5 + cfg_.exploration * UNVISITED_EXPLORE;

    double exploit = child.q();
    double beta = 0.0;
    double amaf = 0.0;
    if (child.rave_visits > 0) {
        beta = cfg_.rave_k / (cfg_.rave_k + child.visits);
        amaf = (double)child.rave_wins / child.rave_visits;
    }
    double pv = (double)std::max<uint32_t>(1, parent.visits);
    double explore = std::sqrt(std::log(pv) / child.visits);
    return (1.0 - beta) * exploit + beta * amaf + cfg_.exploration * explore;
}

int Mcts::select(HexState& st, CellSet played[3]) {
    int idx = ROOT;
    for (;;) {
        const Node& n = nodes_[idx];
        if (n.terminal || !n.untried.empty() || n.children.empty()) return idx;

        int best = -1;
        double best_score = -1e18;
        for (int c : n.children) {
            double s = selection_score(n, nodes_[c]);
            if (s > best_score) {
                best_score = s;
                best = c;
            }
        }
        const Node& ch = nodes_[best];
        st.play(ch.move, ch.mover);
        played[(int)ch.mover].set(ch.move);
        idx = best;
    }
}

// ── Expansion ────────────────────────────────────────────────────────────
int Mcts::expansion_score(const HexState& st, int idx, Side s) const {
    int r = cell_row(idx), c = cell_col(idx);
    int score = -2 * (std::abs(r - CENTER) + std::abs(c - CENTER));
    score += st.bridge_potential(idx, s);
    int last = st.last_move();
    if (last >= 0) {
        int d = std::abs(r - cell_row(last)) + std::abs(c - cell_col(last));
        if (d <= 3) score += 20;
    }
    return score;
}

int Mcts::expand(int idx, HexState& st, CellSet played[3]) {
    Side mover = opponent(nodes_[idx].mover);
    std::vector<int>& untried = nodes_[idx].untried;
    int n = (int)untried.size();
    int samples = std::min(cfg_.expansion_samples, n);

    int best_pos = 0;
    int best_score = INT_MIN;
    for (int i = 0; i < samples; i++) {
        int pos = rand_below(rng_, n);
        int s = expansion_score(st, untried[pos], mover);
        if (s > best_score) {
            best_score = s;
            best_pos = pos;
        }
    }

    int move = untried[best_pos];
    untried[best_pos] = untried.back();
    untried.pop_back();

    st.play(move, mover);
    played[(int)mover].set(move);

    Node child;
    child.parent = idx;
    child.move = move;
    child.mover = mover;
    child.terminal = st.winner() != Side::None;
    if (!child.terminal) child.untried = st.empty_cells();
    nodes_.push_back(std::move(child));
    int ci = (int)nodes_.size() - 1;
    nodes_[idx].children.push_back(ci);
    return ci;
}

// ── Playout ──────────────────────────────────────────────────────────────
Side Mcts::simulate(HexState& st, Side to_move, CellSet played[3]) {
    Side w = st.winner();
    Side s = to_move;
    while (w == Side::None && st.empty_count() > 0) {
        const std::vector<int>& empty = st.empty_cells();
        int n = (int)empty.size();
        int move;
        if (n < cfg_.playout_heuristic_empty_limit && rand_unit(rng_) < cfg_.playout_heuristic_chance) {
            move = empty[rand_below(rng_, n)];
            int best = st.bridge_potential(move, s);
            for (int k = 1; k < cfg_.playout_samples; k++) {
                int c = empty[rand_below(rng_, n)];
                int b = st.bridge_potential(c, s);
                if (b > best) {
                    best = b;
                    move = c;
                }
            }
        } else {
            move = empty[rand_below(rng_, n)];
        }
        st.play(move, s);
        played[(int)s].set(move);
        w = st.winner();
        s = opponent(s);
    }
    return w;
}

// ── Backpropagation ──────────────────────────────────────────────────────
void Mcts::backpropagate(int leaf, Side winner, const CellSet played[3]) {
    int idx = leaf;
    while (idx >= 0) {
        Node& n = nodes_[idx];
        n.visits++;
        if (winner != Side::None && n.mover == winner) n.wins++;

        // AMAF: a child's move counts if its mover claimed that cell later in the game.
        for (int c : n.children) {
            Node& ch = nodes_[c];
            if (!played[(int)ch.mover].test(ch.move)) continue;
            ch.rave_visits++;
            if (ch.mover == winner) ch.rave_wins++;
        }
        idx = n.parent;
    }
}

int Mcts::run_iteration() {
    HexState st = root_state_;
    CellSet played[3];

    int idx = select(st, played);
    if (!nodes_[idx].terminal && !nodes_[idx].untried.empty()) {
        idx = expand(idx, st, played);
    }
    Side winner = simulate(st, opponent(nodes_[idx].mover), played);
    backpropagate(idx, winner, played);
    return idx;
}

// ── Final move ───────────────────────────────────────────────────────────
MoveStats Mcts::stats_for(int child) const {
    const Node& n = nodes_[child];
    MoveStats m;
    m.row = cell_row(n.move);
    m.col = cell_col(n.move);
    m.visits = n.visits;
    m.wins = n.wins;
    m.win_rate = n.visits ? (double)n.wins / n.visits : 0.0;
    return m;
}

int Mcts::pick_final_child() {
    std::vector<int> order = nodes_[ROOT].children;
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return nodes_[a].visits > nodes_[b].visits;
    });

    double t = cfg_.selection_temperature;
    if (t < MIN_TEMPERATURE || order.size() == 1) return order[0];

    int k = std::min<int>(TOP_CANDIDATES, (int)order.size());
    double top = (double)std::max<uint32_t>(1, nodes_[order[0]].visits);
    std::vector<double> w(k, 0.0);
    double sum = 0.0;
    for (int i = 0; i < k; i++) {
        uint32_t v = nodes_[order[i]].visits;
        // visits^(1/T) normalised by the leader to stay finite for small T.
        w[i] = v ? std::exp(std::log(v / top) / t) : 0.0;
        sum += w[i];
    }
    if (!(sum > 0.0) || !std::isfinite(sum)) return order[0];

    double pick = rand_unit(rng_) * sum;
    for (int i = 0; i < k; i++) {
        pick -= w[i];
        if (pick <= 0.0) return order[i];
    }
    return order[0];
}

SearchResult Mcts::search(double time_limit_ms) {
    Deadline deadline(*clock_, time_limit_ms);
    SearchResult res;

    if (nodes_[ROOT].terminal || nodes_[ROOT].untried.empty()) {
        res.elapsed_ms = deadline.elapsed_ms();
        return res;
    }

    uint32_t sims = 0;
    while (sims < cfg_.max_simulations) {
        if (sims > 0 && deadline.expired()) break;
        run_iteration();
        sims++;
    }

    res.found = true;
    res.total_simulations = sims;
    res.best = stats_for(pick_final_child());

    std::vector<int> order = nodes_[ROOT].children;
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return nodes_[a].visits > nodes_[b].visits;
    });
    for (int i = 0; i < (int)order.size() && i < TOP_CANDIDATES; i++) {
        res.alternatives.push_back(stats_for(order[i]));
    }

    res.elapsed_ms = deadline.elapsed_ms();
    res.nps = res.elapsed_ms > 0.0 ? sims * 1000.0 / res.elapsed_ms : (double)sims;

    if (log_enabled()) {
        std::cerr << "[hex] to_move=" << side_name(root_to_move_)
                  << " sims=" << sims << " nodes=" << nodes_.size()
                  << " ms=" << res.elapsed_ms
                  << " best=(" << res.best.row << "," << res.best.col << ")"
                  << " visits=" << res.best.visits
                  << " wr=" << res.best.win_rate << "\n";
    }
    return res;
}

} // namespace hex
} // namespace gridduel
