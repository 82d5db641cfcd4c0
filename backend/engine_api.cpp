#include "engine_api.h"

#include "engine.hpp"
#include "json_codec.hpp"

#include "engine/common/log.hpp"

#include <exception>
#include <iostream>
#include <mutex>
#include <string>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#define GD_KEEPALIVE EMSCRIPTEN_KEEPALIVE
#else
#define GD_KEEPALIVE
#endif

using json = nlohmann::json;

namespace {

std::mutex g_api_mu;
std::string g_last_error;
std::string g_out;

void set_error(const std::string& msg) {
    g_last_error = msg;
    if (gridduel::log_enabled()) std::cerr << "[api] " << msg << "\n";
}

void clear_error() {
    g_last_error.clear();
}

const char* set_out_json(const json& body) {
    g_out = body.dump();
    return g_out.c_str();
}

const char* set_out_string(const std::string& body) {
    g_out = body;
    return g_out.c_str();
}

bool parse_request(const char* raw, json& out) {
    if (!raw) {
        set_error("missing request string");
        return false;
    }
    out = json::parse(raw, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        set_error("request parse failed; expected a JSON object");
        return false;
    }
    return true;
}

} // namespace

extern "C" {

GD_KEEPALIVE int gd_init() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    // Warm the static Zobrist and position tables.
    gridduel::iso::State st = gridduel::iso::State::initial();
    (void)gridduel::iso::zobrist_hash(st, gridduel::Side::Ai);
    (void)gridduel::iso::center_distance(0);
    return 1;
}

GD_KEEPALIVE const char* gd_hex_best_move(const char* request_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    json in;
    if (!parse_request(request_json, in)) return set_out_json(json::object());

    try {
        gridduel::HexMoveRequest req = gridduel::codec::parse_hex_request(in);
        gridduel::hex::SearchResult r = gridduel::hex_best_move(req);
        if (!r.found) set_error("no legal move: board is full or already won");
        return set_out_json(gridduel::codec::hex_result_to_json(r));
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return set_out_json(json::object());
    }
}

GD_KEEPALIVE const char* gd_isolation_best_move(const char* request_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    json in;
    if (!parse_request(request_json, in)) return set_out_json(json::object());

    try {
        gridduel::IsolationMoveRequest req = gridduel::codec::parse_isolation_request(in);
        gridduel::iso::SearchResult r = gridduel::isolation_best_move(req);
        if (!r.found) set_error("no legal move: the side to move is blocked");
        return set_out_json(gridduel::codec::isolation_result_to_json(r));
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return set_out_json(json::object());
    }
}

GD_KEEPALIVE const char* gd_isolation_analyze(const char* request_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    json in;
    if (!parse_request(request_json, in)) return set_out_json(json::object());

    try {
        gridduel::IsolationMoveRequest req = gridduel::codec::parse_isolation_request(in);
        gridduel::IsolationAnalysis a = gridduel::isolation_analyze(req.board, req.difficulty);
        return set_out_json(gridduel::codec::analysis_to_json(a));
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return set_out_json(json::object());
    }
}

GD_KEEPALIVE const char* gd_get_last_error() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    return set_out_string(g_last_error);
}

} // extern "C"
