#pragma once

#include "engine/common/clock.hpp"
#include "engine/isolation/iso_state.hpp"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace gridduel {
namespace iso {

// Largest region the exact solver is allowed to take on.
static const int EXACT_REGION_LIMIT = 25;
// Memo entries kept before the solver gives up on an exact answer.
static const size_t MEMO_LIMIT = size_t(1) << 18;

enum class Confidence { Exact, Heuristic };

// Outcome of asking whether a side can walk at least `target` steps.
enum class PathVerdict { Reaches, Short, Unknown };

struct PathCheck {
    PathVerdict verdict = PathVerdict::Unknown;
    // Exact longest path when Short, a lower bound of at least target when Reaches.
    int length = 0;
};

struct EndgameResult {
    bool found = false;
    Move move;
    int path_length = 0;
    Confidence confidence = Confidence::Heuristic;
    uint64_t nodes = 0;
};

// Longest chain of queen slides inside a sealed region. Memoised on
// (square, visited) and abandoned once 80% of the deadline is spent or the
// memo reaches MEMO_LIMIT entries.
class EndgameSolver {
public:
    explicit EndgameSolver(const Deadline& deadline) : deadline_(&deadline) {}

    EndgameResult solve(const State& st, Side mover);

    // Longest path for `mover` from its current square through empty cells.
    int longest_path(const State& st, Side mover);

    // Stops as soon as a path of `target` steps is found.
    PathCheck path_reaches(const State& st, Side side, int target);

    bool timed_out() const { return timed_out_; }
    bool memo_full() const { return memo_full_; }
    size_t memo_size() const { return memo_.size(); }
    uint64_t nodes() const { return nodes_; }

private:
    int search(int sq, Bitboard visited, int steps);
    bool halted() const { return timed_out_ || memo_full_ || reached_; }
    void start(const State& st, Side side, int target);
    int choose_destroy(const State& moved, Side mover, Bitboard region) const;

    const Deadline* deadline_;
    Bitboard region_ = 0;
    std::unordered_map<uint64_t, int> memo_;
    uint64_t nodes_ = 0;
    int target_ = INT_MAX;
    bool timed_out_ = false;
    bool memo_full_ = false;
    bool reached_ = false;
};

int estimate_longest_path(int region_cells);
bool should_solve_exactly(int region_cells);

} // namespace iso
} // namespace gridduel
