#pragma once

#include "engine/common/clock.hpp"
#include "engine/common/random.hpp"
#include "engine/common/side.hpp"
#include "engine/hex/hex_board.hpp"

#include <bitset>
#include <cstdint>
#include <vector>

namespace gridduel {
namespace hex {

struct MctsConfig {
    uint32_t max_simulations = 80000;
    double playout_heuristic_chance = 0.15;
    double selection_temperature = 0.1;
    double rave_k = 300.0;
    double exploration = 1.0;
    int expansion_samples = 15;
    int playout_samples = 5;
    // Heuristic playouts only once fewer cells than this are empty.
    int playout_heuristic_empty_limit = 80;
    uint64_t seed = 0;
};

// Difficulty 3 / 5 / 7; anything else gets the strongest preset.
MctsConfig config_for_difficulty(int difficulty);

struct MoveStats {
    int row = -1;
    int col = -1;
    uint32_t visits = 0;
    uint32_t wins = 0;
    double win_rate = 0.0;
};

struct SearchResult {
    bool found = false;
    MoveStats best;
    std::vector<MoveStats> alternatives; // top 5 by visits, best first
    uint32_t total_simulations = 0;
    double elapsed_ms = 0.0;
    double nps = 0.0;
};

// Arena node; links are indices into Mcts::nodes_.
struct Node {
    int parent = -1;
    int move = -1;
    Side mover = Side::None; // side that played `move`
    bool terminal = false;
    uint32_t visits = 0;
    uint32_t wins = 0;
    uint32_t rave_visits = 0;
    uint32_t rave_wins = 0;
    std::vector<int> children;
    std::vector<int> untried;

    double q() const { return visits ? (double)wins / visits : 0.5; }
};

class Mcts {
public:
    Mcts(const HexState& root, Side to_move, const MctsConfig& cfg,
         const Clock& clock = default_clock());

    SearchResult search(double time_limit_ms);

    // One selection/expansion/playout/backpropagation cycle.
    // Returns the index of the node the playout started from.
    int run_iteration();

    const Node& node(int idx) const { return nodes_[idx]; }
    size_t node_count() const { return nodes_.size(); }
    static const int ROOT = 0;

private:
    using CellSet = std::bitset<CELL_COUNT>;

    int select(HexState& st, CellSet played[3]);
    int expand(int idx, HexState& st, CellSet played[3]);
    Side simulate(HexState& st, Side to_move, CellSet played[3]);
    void backpropagate(int leaf, Side winner, const CellSet played[3]);
    double selection_score(const Node& parent, const Node& child) const;
    int expansion_score(const HexState& st, int idx, Side s) const;
    int pick_final_child();
    MoveStats stats_for(int child) const;

    HexState root_state_;
    Side root_to_move_;
    MctsConfig cfg_;
    const Clock* clock_;
    Rng rng_;
    std::vector<Node> nodes_;
};

} // namespace hex
} // namespace gridduel
