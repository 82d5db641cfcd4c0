#include <doctest/doctest.h>

#include "engine/isolation/partition.hpp"
#include "engine/isolation/voronoi.hpp"
#include "iso_fixtures.hpp"

using namespace gridduel;
using namespace gridduel::iso;

TEST_CASE("empty board is never partitioned") {
    PartitionResult p = detect_partition(State::initial());
    CHECK_FALSE(p.is_partitioned);
    CHECK(p.human_region_size == 47);
}

TEST_CASE("adjacent pieces are connected") {
    PartitionResult p = detect_partition(sq_index(3, 3), sq_index(3, 4), 0);
    CHECK_FALSE(p.is_partitioned);
}

TEST_CASE("a sealed diagonal band splits the board") {
    State st = test::band_wall();
    const int wall = st.destroyed_count();
    REQUIRE(wall == 13);

    PartitionResult p = detect_partition(st);
    CHECK(p.is_partitioned);
    CHECK(p.human_region_size == 20);
    CHECK(p.ai_region_size == 14);
    CHECK(p.human_region_size + p.ai_region_size == CELL_COUNT - wall - 2);
    CHECK((p.human_region & p.ai_region) == 0);
}

TEST_CASE("a single-width diagonal does not seal queen slides") {
    State st = test::board_from_rows({
        "H......",
        ".#.....",
        "..#....",
        "...#...",
        "....#..",
        ".....#.",
        "......A",
    });
    CHECK_FALSE(detect_partition(st).is_partitioned);
}

TEST_CASE("a full column wall splits the board evenly") {
    State st = test::board_from_rows({
        "H..#...",
        "...#...",
        "...#...",
        "...#...",
        "...#...",
        "...#...",
        "...#..A",
    });
    PartitionResult p = detect_partition(st);
    CHECK(p.is_partitioned);
    CHECK(p.human_region_size == 20);
    CHECK(p.ai_region_size == 20);
    CHECK(p.human_region_size + p.ai_region_size == CELL_COUNT - 7 - 2);
}

TEST_CASE("would_cause_partition and critical cells") {
    State st = test::board_from_rows({
        "...#...",
        "...#...",
        "...#...",
        ".H...A.",
        "...#...",
        "...#...",
        "...#...",
    });
    const int gap = sq_index(3, 3);
    CHECK_FALSE(detect_partition(st).is_partitioned);
    CHECK(would_cause_partition(st, gap));
    CHECK_FALSE(would_cause_partition(st, sq_index(0, 0)));
    CHECK(partition_potential(st, gap) == 0);

    CriticalCellCache cache;
    std::vector<int> critical = find_critical_cells(st, &cache);
    REQUIRE(critical.size() == 1);
    CHECK(critical[0] == gap);
    CHECK(cache.misses() == 1);

    find_critical_cells(st, &cache);
    CHECK(cache.hits() == 1);
}

TEST_CASE("critical-cell cache clears wholesale on overflow") {
    CriticalCellCache cache(2);
    cache.insert(1, {1});
    cache.insert(2, {2});
    CHECK(cache.size() == 2);
    cache.insert(3, {3});
    CHECK(cache.size() == 1);
    CHECK(cache.find(1) == nullptr);
    REQUIRE(cache.find(3) != nullptr);
}

TEST_CASE("voronoi on a symmetric empty board") {
    VoronoiResult v = calculate_voronoi(State::initial());
    CHECK(v.human_count == v.ai_count);
    CHECK(v.human_count + v.ai_count + v.contested_count == 47);
    CHECK((v.human_cells & v.ai_cells) == 0);
    CHECK((v.contested & (v.human_cells | v.ai_cells)) == 0);
}

TEST_CASE("voronoi leaves contested cells to neither side") {
    State st = test::board_from_rows({
        "H.A....",
        ".......",
        ".......",
        ".......",
        ".......",
        ".......",
        ".......",
    });
    VoronoiResult v = calculate_voronoi(st);
    CHECK(v.human_count == 9);
    CHECK(v.ai_count == 13);
    CHECK(v.contested_count == 25);
    CHECK((v.contested & (v.human_cells | v.ai_cells)) == 0);

    CHECK((v.contested & sq_bit(sq_index(0, 1))) != 0);
    CHECK((v.contested & sq_bit(sq_index(1, 1))) != 0);
    CHECK((v.human_cells & sq_bit(sq_index(6, 6))) != 0);
    CHECK((v.ai_cells & sq_bit(sq_index(6, 2))) != 0);
}

TEST_CASE("voronoi respects a sealed wall") {
    VoronoiResult v = calculate_voronoi(test::band_wall());
    CHECK(v.human_count == 20);
    CHECK(v.ai_count == 14);
    CHECK(v.contested_count == 0);
}
