#include "engine.hpp"
#include "json_codec.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

using json = nlohmann::json;

namespace {

void set_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

template <typename Fn>
void register_post(httplib::Server& svr, const std::string& path, Fn&& fn) {
    svr.Post(path, fn);
    svr.Post("/api" + path, fn); // support hosting rewrite prefix
}

// Parses the body and runs `fn`; malformed bodies and engine errors become 400s.
template <typename Fn>
void handle_json(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
    json in = json::parse(req.body, nullptr, false);
    if (in.is_discarded() || !in.is_object()) {
        set_json(res, 400, json{{"error", "invalid JSON body"}});
        return;
    }
    try {
        set_json(res, 200, fn(in));
    } catch (const std::exception& ex) {
        set_json(res, 400, json{{"error", ex.what()}});
    }
}

} // namespace

int main() {
    httplib::Server svr;

    auto health_handler = [](const httplib::Request&, httplib::Response& res) {
        set_json(res, 200, json{{"ok", true}});
    };
    svr.Get("/health", health_handler);
    svr.Get("/api/health", health_handler);

    register_post(svr, "/hex/move", [](const httplib::Request& req, httplib::Response& res) {
        handle_json(req, res, [](const json& in) {
            gridduel::HexMoveRequest r = gridduel::codec::parse_hex_request(in);
            return gridduel::codec::hex_result_to_json(gridduel::hex_best_move(r));
        });
    });

    register_post(svr, "/isolation/move", [](const httplib::Request& req, httplib::Response& res) {
        handle_json(req, res, [](const json& in) {
            gridduel::IsolationMoveRequest r = gridduel::codec::parse_isolation_request(in);
            return gridduel::codec::isolation_result_to_json(gridduel::isolation_best_move(r));
        });
    });

    register_post(svr, "/isolation/analyze", [](const httplib::Request& req, httplib::Response& res) {
        handle_json(req, res, [](const json& in) {
            gridduel::IsolationMoveRequest r = gridduel::codec::parse_isolation_request(in);
            return gridduel::codec::analysis_to_json(gridduel::isolation_analyze(r.board, r.difficulty));
        });
    });

    int port = 8080;
    if (const char* p = std::getenv("PORT")) {
        try {
            port = std::stoi(p);
        } catch (const std::exception&) {
            std::fprintf(stderr, "[server] invalid PORT '%s', using 8080\n", p);
            port = 8080;
        }
    }

    std::printf("GridDuel engine API listening on 0.0.0.0:%d\n", port);
    if (!svr.listen("0.0.0.0", port)) {
        std::fprintf(stderr, "[server] failed to bind port %d\n", port);
        return 1;
    }
    return 0;
}
