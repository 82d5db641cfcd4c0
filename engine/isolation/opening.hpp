#pragma once

#include "engine/isolation/iso_state.hpp"

namespace gridduel {
namespace iso {

// Most destroyed cells at which the book still answers.
static const int OPENING_PLIES = 8;

struct OpeningChoice {
    bool found = false;
    Move move;
    int score = 0;
};

// Turn at most 12 and at most OPENING_PLIES cells destroyed.
bool is_opening_phase(int turn, int destroyed_count);

// Static slide + destroy pick for `mover`. Not found once the book range is
// over or when every slide would leave the mover stuck.
OpeningChoice opening_move(const State& st, Side mover);

int score_opening_slide(const State& st, Side mover, int to);
int score_opening_destroy(const State& moved, Side mover, int cell);

} // namespace iso
} // namespace gridduel
