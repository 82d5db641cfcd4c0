#pragma once

#include "engine/common/side.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace gridduel {
namespace hex {

static const int BOARD_SIZE = 11;
static const int CELL_COUNT = BOARD_SIZE * BOARD_SIZE;
// Two virtual terminals appended after the real cells.
static const int VIRTUAL_A = CELL_COUNT;
static const int VIRTUAL_B = CELL_COUNT + 1;

inline int cell_index(int r, int c) { return r * BOARD_SIZE + c; }
inline int cell_row(int idx) { return idx / BOARD_SIZE; }
inline int cell_col(int idx) { return idx % BOARD_SIZE; }
inline bool on_board(int r, int c) { return r >= 0 && r < BOARD_SIZE && c >= 0 && c < BOARD_SIZE; }

// Offset-coordinate neighbours; writes up to 6 indices, returns the count.
int neighbors(int idx, int out[6]);

// ── Union-Find ───────────────────────────────────────────────────────────
class UnionFind {
public:
    explicit UnionFind(int n = CELL_COUNT + 2);

    int find(int x);
    void unite(int a, int b);
    bool connected(int a, int b) { return find(a) == find(b); }
    int size() const { return (int)parent_.size(); }

private:
    std::vector<int> parent_;
    std::vector<uint8_t> rank_;
};

// ── Board state ──────────────────────────────────────────────────────────
// Human connects left/right, AI connects top/bottom. Copied on branch.
class HexState {
public:
    HexState();

    // Builds from a flat 121-cell array of Side values. Caller validates length.
    static HexState from_cells(const std::vector<int>& cells);

    // Precondition: idx is on the board and empty.
    void play(int idx, Side s);

    Side at(int idx) const { return board_[idx]; }
    bool is_empty(int idx) const { return board_[idx] == Side::None; }
    Side winner();

    const std::vector<int>& empty_cells() const { return empty_; }
    int empty_count() const { return (int)empty_.size(); }
    int last_move() const { return last_move_; }

    // +40 for >= 2 own neighbours, +60 for >= 2 opponent neighbours.
    int bridge_potential(int idx, Side s) const;

    // Inverse map agrees with the empty list.
    bool empty_index_consistent() const;

private:
    void remove_empty(int idx);

    std::array<Side, CELL_COUNT> board_;
    std::vector<int> empty_;
    std::array<int, CELL_COUNT> empty_pos_;
    UnionFind uf_human_;
    UnionFind uf_ai_;
    int last_move_ = -1;
};

} // namespace hex
} // namespace gridduel
