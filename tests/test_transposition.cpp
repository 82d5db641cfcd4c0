#include <doctest/doctest.h>

#include "engine/isolation/transposition.hpp"
#include "iso_fixtures.hpp"

using namespace gridduel;
using namespace gridduel::iso;

static Move make_move(int from, int to, int destroy) {
    Move m;
    m.from = from;
    m.to = to;
    m.destroy = destroy;
    return m;
}

TEST_CASE("exact entry round trip") {
    TranspositionTable tt(1024);
    uint64_t key = zobrist_hash(State::initial(), Side::Ai);
    Move m = make_move(48, 24, 40);
    tt.store(key, 6, 1234, Bound::Exact, m);

    for (int depth = 0; depth <= 6; depth++) {
        const TTEntry* e = tt.probe(key);
        REQUIRE(e != nullptr);
        CHECK(e->depth >= depth);
        CHECK(e->bound == Bound::Exact);
        CHECK(e->score == 1234);
        CHECK(e->move() == m);
    }
    CHECK(tt.hits() == 7);
}

TEST_CASE("shallow entries still supply an ordering move") {
    TranspositionTable tt(1024);
    tt.store(99, 1, -50, Bound::Upper, make_move(0, 8, 9));
    const TTEntry* e = tt.probe(99);
    REQUIRE(e != nullptr);
    CHECK(e->depth == 1);
    CHECK(e->move().to == 8);
    CHECK(tt.probe(100) == nullptr);
    CHECK(tt.misses() == 1);
}

TEST_CASE("stale generations are replaced first") {
    TranspositionTable tt(64);
    const uint64_t clusters = tt.capacity() / 2;
    const uint64_t a = 5, b = 5 + clusters, c = 5 + 2 * clusters;

    tt.store(a, 8, 10, Bound::Exact, make_move(0, 1, 2));
    tt.store(b, 1, 20, Bound::Exact, make_move(0, 1, 3));
    REQUIRE(tt.probe(a) != nullptr);
    REQUIRE(tt.probe(b) != nullptr);

    tt.new_search();
    tt.new_search();
    tt.new_search();
    CHECK(tt.generation() == 3);

    tt.store(c, 1, 30, Bound::Exact, make_move(0, 1, 4));
    CHECK(tt.probe(a) == nullptr);
    REQUIRE(tt.probe(c) != nullptr);
    CHECK(tt.probe(c)->score == 30);
}

TEST_CASE("deeper entries are kept over shallow ones") {
    TranspositionTable tt(64);
    tt.store(7, 6, 100, Bound::Lower, make_move(0, 1, 2));
    tt.store(7, 2, 5, Bound::Lower, make_move(0, 3, 4));
    const TTEntry* e = tt.probe(7);
    REQUIRE(e != nullptr);
    CHECK(e->depth == 6);
    CHECK(e->score == 100);
}

TEST_CASE("zobrist hash is deterministic and sensitive") {
    State st = test::band_wall();
    const uint64_t h = zobrist_hash(st, Side::Ai);
    CHECK(zobrist_hash(st, Side::Ai) == h);
    CHECK(zobrist_hash(st, Side::Human) != h);

    State moved_human = st;
    moved_human.human = sq_bit(sq_index(1, 0));
    CHECK(zobrist_hash(moved_human, Side::Ai) != h);

    State moved_ai = st;
    moved_ai.ai = sq_bit(sq_index(5, 6));
    CHECK(zobrist_hash(moved_ai, Side::Ai) != h);

    State more_destroyed = st;
    more_destroyed.destroyed |= sq_bit(sq_index(3, 0));
    CHECK(zobrist_hash(more_destroyed, Side::Ai) != h);
}

TEST_CASE("incremental update matches a full rehash") {
    State st = State::initial();
    uint64_t h = zobrist_hash(st, Side::Ai);

    State after = st.apply(Side::Ai, 24, 48);
    uint64_t inc = zobrist_update(h, Side::Ai, 48, 24, 48);
    CHECK(inc == zobrist_hash(after, Side::Human));

    State after2 = after.apply(Side::Human, 8, 16);
    inc = zobrist_update(inc, Side::Human, 0, 8, 16);
    CHECK(inc == zobrist_hash(after2, Side::Ai));

    CHECK(zobrist_pass(zobrist_hash(st, Side::Ai)) == zobrist_hash(st, Side::Human));
}
