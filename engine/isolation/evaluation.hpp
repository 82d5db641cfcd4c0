#pragma once

#include "engine/isolation/iso_state.hpp"
#include "engine/isolation/partition.hpp"

namespace gridduel {
namespace iso {

static const int NEUTRAL_SCORE = 0;

struct EvalWeights {
    double territory = 4.0;
    double mobility = 7.0;
    double mobility_potential = 3.0;
    double center = 2.0;
    double corner = 2.5;
    double partition = 300.0;
    double critical = 3.0;
    double openness = 0.8;
    double parity = 30.0;
    double trap = 100.0;
    double effective_mobility = 4.0;
};

// Difficulty 3 / 5 / 7. Unknown codes use the 5 table.
EvalWeights weights_for_difficulty(int difficulty);

enum class Phase { Opening, Midgame, Endgame };

Phase phase_for(int destroyed_count);
const char* phase_name(Phase p);

// Scales the difficulty weights by the schedule for the current phase.
// Effective mobility is zeroed outside the endgame.
EvalWeights phase_weights(const EvalWeights& base, int destroyed_count);

// Raw component values, all from the AI's point of view.
struct EvalComponents {
    double territory = 0.0;
    double mobility = 0.0;
    double mobility_potential = 0.0;
    double center = 0.0;
    double corner = 0.0;
    double partition = 0.0;
    double critical = 0.0;
    double openness = 0.0;
    double parity = 0.0;
    double trap = 0.0;
    double effective_mobility = 0.0;

    bool partitioned = false;
    bool desperate = false;
    Phase phase = Phase::Opening;
    int total = 0;
};

// Positive favours the AI. A state with a missing piece scores NEUTRAL_SCORE.
int evaluate(const State& st, const EvalWeights& base,
             CriticalCellCache* cache = nullptr, EvalComponents* out = nullptr);

int center_distance(int sq);
int corner_proximity(int sq);

} // namespace iso
} // namespace gridduel
