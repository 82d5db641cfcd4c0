#include "engine/hex/hex_board.hpp"

#include <numeric>

namespace gridduel {
namespace hex {

static const int EVEN_ROW_DIRS[6][2] = {{-1, -1}, {-1, 0}, {0, -1}, {0, 1}, {1, -1}, {1, 0}};
static const int ODD_ROW_DIRS[6][2]  = {{-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, 0}, {1, 1}};

int neighbors(int idx, int out[6]) {
    int r = cell_row(idx), c = cell_col(idx);
    const int (*dirs)[2] = (r % 2 == 0) ? EVEN_ROW_DIRS : ODD_ROW_DIRS;
    int n = 0;
    for (int i = 0; i < 6; i++) {
        int nr = r + dirs[i][0], nc = c + dirs[i][1];
        if (on_board(nr, nc)) out[n++] = cell_index(nr, nc);
    }
    return n;
}

// ── Union-Find ───────────────────────────────────────────────────────────
UnionFind::UnionFind(int n) : parent_(n), rank_(n, 0) {
    std::iota(parent_.begin(), parent_.end(), 0);
}

int UnionFind::find(int x) {
    int root = x;
    while (parent_[root] != root) root = parent_[root];
    while (parent_[x] != root) {
        int next = parent_[x];
        parent_[x] = root;
        x = next;
    }
    return root;
}

void UnionFind::unite(int a, int b) {
    int ra = find(a), rb = find(b);
    if (ra == rb) return;
    if (rank_[ra] < rank_[rb]) {
        parent_[ra] = rb;
    } else if (rank_[ra] > rank_[rb]) {
        parent_[rb] = ra;
    } else {
        parent_[rb] = ra;
        rank_[ra]++;
    }
}

// ── Board state ──────────────────────────────────────────────────────────
HexState::HexState() {
    board_.fill(Side::None);
    empty_.resize(CELL_COUNT);
    for (int i = 0; i < CELL_COUNT; i++) {
        empty_[i] = i;
        empty_pos_[i] = i;
    }
}

HexState HexState::from_cells(const std::vector<int>& cells) {
    HexState st;
    for (int i = 0; i < CELL_COUNT && i < (int)cells.size(); i++) {
        if (cells[i] == (int)Side::Human) st.play(i, Side::Human);
        else if (cells[i] == (int)Side::Ai) st.play(i, Side::Ai);
    }
    st.last_move_ = -1;
    return st;
}

void HexState::remove_empty(int idx) {
    int pos = empty_pos_[idx];
    if (pos < 0) return;
    int tail = empty_.back();
    empty_[pos] = tail;
    empty_pos_[tail] = pos;
    empty_.pop_back();
    empty_pos_[idx] = -1;
}

void HexState::play(int idx, Side s) {
    board_[idx] = s;
    remove_empty(idx);
    last_move_ = idx;

    int r = cell_row(idx), c = cell_col(idx);
    UnionFind& uf = (s == Side::Human) ? uf_human_ : uf_ai_;
    if (s == Side::Human) {
        if (c == 0) uf.unite(idx, VIRTUAL_A);
        if (c == BOARD_SIZE - 1) uf.unite(idx, VIRTUAL_B);
    } else {
        if (r == 0) uf.unite(idx, VIRTUAL_A);
        if (r == BOARD_SIZE - 1) uf.unite(idx, VIRTUAL_B);
    }

    int nb[6];
    int n = neighbors(idx, nb);
    for (int i = 0; i < n; i++) {
        if (board_[nb[i]] == s) uf.unite(idx, nb[i]);
    }
}

Side HexState::winner() {
    if (uf_human_.connected(VIRTUAL_A, VIRTUAL_B)) return Side::Human;
    if (uf_ai_.connected(VIRTUAL_A, VIRTUAL_B)) return Side::Ai;
    return Side::None;
}

int HexState::bridge_potential(int idx, Side s) const {
    int nb[6];
    int n = neighbors(idx, nb);
    int own = 0, opp = 0;
    Side o = opponent(s);
    for (int i = 0; i < n; i++) {
        if (board_[nb[i]] == s) own++;
        else if (board_[nb[i]] == o) opp++;
    }
    int score = 0;
    if (own >= 2) score += 40;
    if (opp >= 2) score += 60;
    return score;
}

bool HexState::empty_index_consistent() const {
    int count = 0;
    for (int i = 0; i < CELL_COUNT; i++) {
        if (board_[i] == Side::None) {
            count++;
            int p = empty_pos_[i];
            if (p < 0 || p >= (int)empty_.size() || empty_[p] != i) return false;
        } else if (empty_pos_[i] != -1) {
            return false;
        }
    }
    return count == (int)empty_.size();
}

} // namespace hex
} // namespace gridduel
