#pragma once

#include "engine/common/clock.hpp"
#include "engine/hex/hex_mcts.hpp"
#include "engine/isolation/evaluation.hpp"
#include "engine/isolation/partition.hpp"
#include "engine/isolation/search.hpp"
#include "engine/isolation/voronoi.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridduel {

static const int DIFFICULTY_UNKNOWN = -1;

struct HexMoveRequest {
    std::vector<int> board;      // 121 cells: 0 empty, 1 human, 2 AI
    bool ai_turn = true;
    int time_ms = 0;             // <= 0 uses the default budget
    int difficulty = 7;
    int max_simulations = 0;     // > 0 overrides the preset
    uint64_t seed = 0;
};

struct IsolationMoveRequest {
    std::vector<int> board;      // 49 cells: 0 empty, 1 human, 2 AI, 3 destroyed
    bool ai_turn = true;
    int time_ms = 0;             // <= 0 uses the preset budget
    int difficulty = 5;
    int max_depth = 0;           // > 0 overrides the preset
};

struct IsolationAnalysis {
    int score = 0;
    int human_mobility = 0;
    int ai_mobility = 0;
    iso::EvalComponents components;
    iso::PartitionResult partition;
    iso::VoronoiResult voronoi;
    std::vector<int> critical_cells;
};

// "7", "NEXUS-7", "hard" -> 7; "5"/"medium" -> 5; "3"/"easy" -> 3.
int normalize_difficulty(const std::string& label);
int normalize_difficulty(int code);

// Both throw std::invalid_argument on a wrong board length or cell value.
void validate_hex_board(const std::vector<int>& board);
void validate_isolation_board(const std::vector<int>& board);

hex::SearchResult hex_best_move(const HexMoveRequest& req, const Clock& clock = default_clock());
iso::SearchResult isolation_best_move(const IsolationMoveRequest& req,
                                      const Clock& clock = default_clock());
IsolationAnalysis isolation_analyze(const std::vector<int>& board, int difficulty);

} // namespace gridduel
