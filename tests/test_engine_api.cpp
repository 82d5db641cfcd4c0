#include <doctest/doctest.h>

#include "backend/engine_api.h"
#include "iso_fixtures.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

TEST_CASE("api rejects malformed requests") {
    REQUIRE(gd_init() == 1);

    CHECK(std::string(gd_hex_best_move("not json")) == "{}");
    CHECK(std::string(gd_get_last_error()).find("parse") != std::string::npos);

    CHECK(std::string(gd_isolation_best_move(nullptr)) == "{}");
    CHECK_FALSE(std::string(gd_get_last_error()).empty());

    json req{{"board", json::array({0, 0, 0})}};
    CHECK(std::string(gd_hex_best_move(req.dump().c_str())) == "{}");
    CHECK(std::string(gd_get_last_error()).find("121") != std::string::npos);

    json no_board{{"ai_turn", true}};
    CHECK(std::string(gd_isolation_analyze(no_board.dump().c_str())) == "{}");
    CHECK(std::string(gd_get_last_error()).find("board") != std::string::npos);
}

TEST_CASE("api hex move") {
    json req{
        {"board", std::vector<int>(121, 0)},
        {"ai_turn", true},
        {"max_simulations", 200},
        {"time_ms", 10000},
        {"seed", 3}
    };
    json out = json::parse(gd_hex_best_move(req.dump().c_str()));
    CHECK(std::string(gd_get_last_error()).empty());
    REQUIRE(out["found"].get<bool>());
    CHECK(out["best_move"]["r"].get<int>() >= 0);
    CHECK(out["best_move"]["c"].get<int>() < 11);
    CHECK(out["total_simulations"].get<int>() <= 200);
    CHECK(out["alternatives"].size() <= 5);
}

TEST_CASE("api isolation move uses cell coordinates") {
    json req{
        {"board", gridduel::test::to_cells(gridduel::iso::State::initial())},
        {"ai_turn", true},
        {"difficulty", "NEXUS-5"},
        {"time_ms", 2000}
    };
    json out = json::parse(gd_isolation_best_move(req.dump().c_str()));
    REQUIRE(out["found"].get<bool>());
    CHECK(out["move"]["from"]["r"].get<int>() == 6);
    CHECK(out["move"]["from"]["c"].get<int>() == 6);
    CHECK(out["move"]["destroy"].is_object());
    CHECK(out["source"].get<std::string>() == "opening_book");
    CHECK(out["confidence"].get<std::string>() == "heuristic");
}

TEST_CASE("api analysis reports partition state") {
    json req{{"board", gridduel::test::to_cells(gridduel::test::band_wall())}};
    json out = json::parse(gd_isolation_analyze(req.dump().c_str()));
    CHECK(out["partition"]["is_partitioned"].get<bool>());
    CHECK(out["partition"]["ai_region_size"].get<int>() == 14);
    CHECK(out["phase"].get<std::string>() == "midgame");
    CHECK(out["components"].contains("territory"));
}
