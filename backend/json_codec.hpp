#pragma once

#include "engine.hpp"

#include <nlohmann/json.hpp>

namespace gridduel {
namespace codec {

using json = nlohmann::json;

// Throw std::invalid_argument (or nlohmann::json::exception) on malformed input.
HexMoveRequest parse_hex_request(const json& in);
IsolationMoveRequest parse_isolation_request(const json& in);
int parse_difficulty(const json& in, int fallback);

json hex_result_to_json(const hex::SearchResult& r);
json isolation_result_to_json(const iso::SearchResult& r);
json analysis_to_json(const IsolationAnalysis& a);

} // namespace codec
} // namespace gridduel
