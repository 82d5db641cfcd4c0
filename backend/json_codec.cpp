#include "json_codec.hpp"

#include <stdexcept>

namespace gridduel {
namespace codec {
namespace {

std::vector<int> parse_board(const json& in) {
    if (!in.is_object()) throw std::invalid_argument("request must be a JSON object");
    if (!in.contains("board") || !in.at("board").is_array()) {
        throw std::invalid_argument("missing board array");
    }
    return in.at("board").get<std::vector<int>>();
}

json cell_to_json(int sq) {
    if (sq < 0) return nullptr;
    return json{{"r", iso::sq_row(sq)}, {"c", iso::sq_col(sq)}};
}

json hex_stats_to_json(const hex::MoveStats& m) {
    return json{
        {"r", m.row},
        {"c", m.col},
        {"visits", m.visits},
        {"wins", m.wins},
        {"win_rate", m.win_rate}
    };
}

json bitboard_cells(iso::Bitboard b) {
    json cells = json::array();
    while (b) cells.push_back(cell_to_json(iso::bb_pop_lsb(b)));
    return cells;
}

} // namespace

int parse_difficulty(const json& in, int fallback) {
    if (!in.is_object() || !in.contains("difficulty")) return fallback;
    const json& d = in.at("difficulty");
    int code = DIFFICULTY_UNKNOWN;
    if (d.is_number_integer()) code = normalize_difficulty(d.get<int>());
    else if (d.is_string()) code = normalize_difficulty(d.get<std::string>());
    return code == DIFFICULTY_UNKNOWN ? fallback : code;
}

HexMoveRequest parse_hex_request(const json& in) {
    HexMoveRequest req;
    req.board = parse_board(in);
    req.ai_turn = in.value("ai_turn", true);
    req.time_ms = in.value("time_ms", 0);
    req.difficulty = parse_difficulty(in, 7);
    req.max_simulations = in.value("max_simulations", 0);
    req.seed = in.value("seed", (uint64_t)0);
    return req;
}

IsolationMoveRequest parse_isolation_request(const json& in) {
    IsolationMoveRequest req;
    req.board = parse_board(in);
    req.ai_turn = in.value("ai_turn", true);
    req.time_ms = in.value("time_ms", 0);
    req.difficulty = parse_difficulty(in, 5);
    req.max_depth = in.value("max_depth", 0);
    return req;
}

json hex_result_to_json(const hex::SearchResult& r) {
    json alts = json::array();
    for (const auto& m : r.alternatives) alts.push_back(hex_stats_to_json(m));

    json out{
        {"found", r.found},
        {"alternatives", alts},
        {"total_simulations", r.total_simulations},
        {"elapsed_ms", r.elapsed_ms},
        {"nps", r.nps}
    };
    out["best_move"] = r.found ? hex_stats_to_json(r.best) : json(nullptr);
    return out;
}

json isolation_result_to_json(const iso::SearchResult& r) {
    json move = nullptr;
    if (r.found) {
        move = json{
            {"from", cell_to_json(r.move.from)},
            {"to", cell_to_json(r.move.to)},
            {"destroy", cell_to_json(r.move.destroy)}
        };
    }
    return json{
        {"found", r.found},
        {"move", move},
        {"score", r.score},
        {"depth", r.depth},
        {"nodes", r.nodes},
        {"elapsed_ms", r.elapsed_ms},
        {"solved", r.solved},
        {"confidence", r.solved ? "exact" : "heuristic"},
        {"source", iso::source_name(r.source)},
        {"partitioned", r.partitioned},
        {"tt_hit_rate", r.tt_hit_rate}
    };
}

json analysis_to_json(const IsolationAnalysis& a) {
    const iso::EvalComponents& c = a.components;
    json components{
        {"territory", c.territory},
        {"mobility", c.mobility},
        {"mobility_potential", c.mobility_potential},
        {"center", c.center},
        {"corner", c.corner},
        {"partition", c.partition},
        {"critical", c.critical},
        {"openness", c.openness},
        {"parity", c.parity},
        {"trap", c.trap},
        {"effective_mobility", c.effective_mobility}
    };
    json critical = json::array();
    for (int sq : a.critical_cells) critical.push_back(cell_to_json(sq));

    return json{
        {"score", a.score},
        {"phase", iso::phase_name(c.phase)},
        {"desperate", c.desperate},
        {"components", components},
        {"mobility", {{"human", a.human_mobility}, {"ai", a.ai_mobility}}},
        {"partition", {
            {"is_partitioned", a.partition.is_partitioned},
            {"human_region_size", a.partition.human_region_size},
            {"ai_region_size", a.partition.ai_region_size}
        }},
        {"voronoi", {
            {"human", a.voronoi.human_count},
            {"ai", a.voronoi.ai_count},
            {"contested", a.voronoi.contested_count},
            {"contested_cells", bitboard_cells(a.voronoi.contested)}
        }},
        {"critical_cells", critical}
    };
}

} // namespace codec
} // namespace gridduel
