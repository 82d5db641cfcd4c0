#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Initialize engine tables. Returns 1 on success.
int gd_init();

// Hex move from a JSON request:
// {"board":[121 ints],"ai_turn":true,"time_ms":2000,"difficulty":7,"seed":0}
// Returns a JSON result, or {} with gd_get_last_error() set.
const char* gd_hex_best_move(const char* request_json);

// Isolation move from a JSON request:
// {"board":[49 ints, 3 = destroyed],"ai_turn":true,"time_ms":3000,"difficulty":"NEXUS-5"}
const char* gd_isolation_best_move(const char* request_json);

// Evaluation breakdown, partition and territory summary for a position.
const char* gd_isolation_analyze(const char* request_json);

// Retrieve last API error string.
const char* gd_get_last_error();

#ifdef __cplusplus
}
#endif
