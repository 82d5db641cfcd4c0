#include "engine.hpp"

#include "engine/common/log.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace gridduel {
namespace {

static const double HEX_DEFAULT_TIME_MS = 5000.0;

std::string to_lower_ascii(std::string s) {
    for (char& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

void validate_cells(const std::vector<int>& board, size_t expected, int max_value, const char* game) {
    if (board.size() != expected) {
        throw std::invalid_argument(std::string(game) + " board must have " + std::to_string(expected) +
                                    " cells, got " + std::to_string(board.size()));
    }
    for (size_t i = 0; i < board.size(); i++) {
        if (board[i] < 0 || board[i] > max_value) {
            throw std::invalid_argument(std::string(game) + " board cell " + std::to_string(i) +
                                        " has invalid value " + std::to_string(board[i]));
        }
    }
}

} // namespace

int normalize_difficulty(int code) {
    if (code == 3 || code == 5 || code == 7) return code;
    return DIFFICULTY_UNKNOWN;
}

int normalize_difficulty(const std::string& label) {
    std::string d = to_lower_ascii(label);
    if (d.rfind("nexus-", 0) == 0 || d.rfind("nexus_", 0) == 0) d = d.substr(6);
    if (d == "3" || d == "easy" || d == "beginner") return 3;
    if (d == "5" || d == "medium" || d == "normal") return 5;
    if (d == "7" || d == "hard" || d == "expert") return 7;
    return DIFFICULTY_UNKNOWN;
}

void validate_hex_board(const std::vector<int>& board) {
    validate_cells(board, hex::CELL_COUNT, 2, "hex");
}

void validate_isolation_board(const std::vector<int>& board) {
    validate_cells(board, iso::CELL_COUNT, iso::CELL_DESTROYED, "isolation");
    if (!iso::State::from_cells(board).well_formed()) {
        throw std::invalid_argument("isolation board has no free cell for a missing piece");
    }
}

hex::SearchResult hex_best_move(const HexMoveRequest& req, const Clock& clock) {
    validate_hex_board(req.board);

    hex::MctsConfig cfg = hex::config_for_difficulty(req.difficulty);
    if (req.max_simulations > 0) cfg.max_simulations = (uint32_t)req.max_simulations;
    cfg.seed = req.seed;

    hex::HexState st = hex::HexState::from_cells(req.board);
    Side to_move = req.ai_turn ? Side::Ai : Side::Human;
    double budget = req.time_ms > 0 ? (double)req.time_ms : HEX_DEFAULT_TIME_MS;

    hex::Mcts mcts(st, to_move, cfg, clock);
    hex::SearchResult res = mcts.search(budget);
    if (!res.found && log_enabled()) {
        std::cerr << "[hex] no move: board full or already won\n";
    }
    return res;
}

iso::SearchResult isolation_best_move(const IsolationMoveRequest& req, const Clock& clock) {
    validate_isolation_board(req.board);

    iso::SearchConfig cfg = iso::config_for_difficulty(req.difficulty);
    if (req.time_ms > 0) cfg.time_limit_ms = (double)req.time_ms;
    if (req.max_depth > 0) cfg.max_depth = req.max_depth;

    iso::State st = iso::State::from_cells(req.board);
    Side mover = req.ai_turn ? Side::Ai : Side::Human;

    iso::Searcher searcher(cfg, clock);
    iso::SearchResult res = searcher.search(st, mover);
    if (log_enabled()) {
        std::cerr << "[iso] mover=" << side_name(mover)
                  << " source=" << iso::source_name(res.source)
                  << " depth=" << res.depth << " score=" << res.score
                  << " nodes=" << res.nodes << " ms=" << res.elapsed_ms << "\n";
    }
    return res;
}

IsolationAnalysis isolation_analyze(const std::vector<int>& board, int difficulty) {
    validate_isolation_board(board);

    iso::State st = iso::State::from_cells(board);
    iso::CriticalCellCache cache;
    IsolationAnalysis out;
    out.score = iso::evaluate(st, iso::weights_for_difficulty(difficulty), &cache, &out.components);
    out.human_mobility = st.mobility(Side::Human);
    out.ai_mobility = st.mobility(Side::Ai);
    out.partition = iso::detect_partition(st);
    out.voronoi = iso::calculate_voronoi(st);
    out.critical_cells = iso::find_critical_cells(st, &cache);
    return out;
}

} // namespace gridduel
