#include <doctest/doctest.h>

#include "engine/hex/hex_board.hpp"

#include <algorithm>
#include <random>

using namespace gridduel;
using namespace gridduel::hex;

TEST_CASE("hex neighbors respect row parity and edges") {
    int nb[6];
    CHECK(neighbors(cell_index(0, 0), nb) == 2);
    CHECK(neighbors(cell_index(5, 5), nb) == 6);
    CHECK(neighbors(cell_index(1, 10), nb) == 3);

    int n = neighbors(cell_index(5, 5), nb);
    std::vector<int> got(nb, nb + n);
    std::sort(got.begin(), got.end());
    std::vector<int> want = {cell_index(4, 5), cell_index(4, 6), cell_index(5, 4),
                             cell_index(5, 6), cell_index(6, 5), cell_index(6, 6)};
    std::sort(want.begin(), want.end());
    CHECK(got == want);
}

TEST_CASE("hex neighbor relation is symmetric") {
    for (int a = 0; a < CELL_COUNT; a++) {
        int nb[6];
        int n = neighbors(a, nb);
        for (int i = 0; i < n; i++) {
            int back[6];
            int m = neighbors(nb[i], back);
            CHECK(std::find(back, back + m, a) != back + m);
        }
    }
}

TEST_CASE("union-find connectivity") {
    UnionFind uf(10);
    CHECK_FALSE(uf.connected(1, 2));
    uf.unite(1, 2);
    uf.unite(3, 4);
    CHECK(uf.connected(1, 2));
    CHECK_FALSE(uf.connected(2, 3));
    uf.unite(2, 4);
    CHECK(uf.connected(1, 3));
    CHECK(uf.find(1) == uf.find(uf.find(1)));
}

TEST_CASE("union-find result does not depend on union order") {
    std::vector<std::pair<int, int>> unions = {{0, 1}, {2, 3}, {1, 3}, {5, 6}, {7, 5}, {8, 9}};
    UnionFind a(10), b(10);
    for (const auto& u : unions) a.unite(u.first, u.second);
    for (auto it = unions.rbegin(); it != unions.rend(); ++it) b.unite(it->second, it->first);
    for (int i = 0; i < 10; i++) {
        for (int j = 0; j < 10; j++) CHECK(a.connected(i, j) == b.connected(i, j));
    }
    CHECK(a.connected(0, 2));
    CHECK(a.connected(6, 7));
    CHECK_FALSE(a.connected(4, 0));
}

TEST_CASE("human wins by joining left and right edges") {
    HexState st;
    for (int c = 0; c < BOARD_SIZE - 1; c++) st.play(cell_index(0, c), Side::Human);
    CHECK(st.winner() == Side::None);
    st.play(cell_index(0, BOARD_SIZE - 1), Side::Human);
    CHECK(st.winner() == Side::Human);
}

TEST_CASE("ai wins by joining top and bottom edges") {
    HexState st;
    for (int r = 0; r < BOARD_SIZE; r++) st.play(cell_index(r, 0), Side::Ai);
    CHECK(st.winner() == Side::Ai);
}

TEST_CASE("empty-cell inverse map survives swap removal") {
    HexState st;
    std::mt19937 rng(1234);
    Side s = Side::Human;
    for (int i = 0; i < 90; i++) {
        const std::vector<int>& empty = st.empty_cells();
        std::uniform_int_distribution<int> pick(0, (int)empty.size() - 1);
        st.play(empty[pick(rng)], s);
        s = opponent(s);
        REQUIRE(st.empty_index_consistent());
    }
    CHECK(st.empty_count() == CELL_COUNT - 90);
}

TEST_CASE("bridge potential counts own and opponent neighbours") {
    HexState st;
    st.play(cell_index(5, 4), Side::Human);
    st.play(cell_index(5, 6), Side::Human);
    CHECK(st.bridge_potential(cell_index(5, 5), Side::Human) == 40);
    CHECK(st.bridge_potential(cell_index(5, 5), Side::Ai) == 60);
    CHECK(st.bridge_potential(cell_index(0, 0), Side::Ai) == 0);
}

TEST_CASE("from_cells rebuilds connectivity") {
    std::vector<int> cells(CELL_COUNT, 0);
    for (int r = 0; r < BOARD_SIZE; r++) cells[cell_index(r, 3)] = 2;
    HexState st = HexState::from_cells(cells);
    CHECK(st.winner() == Side::Ai);
    CHECK(st.empty_count() == CELL_COUNT - BOARD_SIZE);
    CHECK(st.last_move() == -1);
}
