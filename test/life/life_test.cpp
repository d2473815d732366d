#include <gtest/gtest.h>

#include <climits>
#include <string>
#include <vector>

#include "life.hpp"

namespace {

// '#' alive, anything else dead; one string per row.
std::vector<std::vector<int>> grid(const std::vector<std::string>& rows)
{
    std::vector<std::vector<int>> out;
    for (const auto& r : rows) {
        std::vector<int> row;
        for (char c : r)
            row.push_back(c == '#' ? 1 : 0);
        out.push_back(row);
    }
    return out;
}

LifeParameters withEdge(EdgePolicy edge)
{
    LifeParameters p;
    p.edge = edge;
    return p;
}

} // namespace

TEST(LifeTest, AllDeadStaysDead)
{
    Life life(grid({"...", "...", "..."}));
    life.step();

    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 3; ++x)
            EXPECT_FALSE(life.alive(x, y));
    EXPECT_EQ(life.population(), 0);
    EXPECT_EQ(life.generation(), 1u);
}

TEST(LifeTest, BlinkerOscillatesOnTorus)
{
    const auto vertical = grid({".....",
                                "..#..",
                                "..#..",
                                "..#..",
                                "....."});
    const auto horizontal = grid({".....",
                                  ".....",
                                  ".###.",
                                  ".....",
                                  "....."});
    Life life(vertical, withEdge(EDGE_TORUS));

    life.step();
    EXPECT_TRUE(life.snapshot() == Life(horizontal).snapshot());

    life.step();
    EXPECT_TRUE(life.snapshot() == Life(vertical).snapshot());
}

TEST(LifeTest, BlinkerOscillatesOnBoundedGrid)
{
    Life life(grid({".....",
                    "..#..",
                    "..#..",
                    "..#..",
                    "....."}), withEdge(EDGE_DEAD));
    const Pattern start = life.snapshot();

    life.step();
    EXPECT_TRUE(life.alive(1, 2));
    EXPECT_TRUE(life.alive(2, 2));
    EXPECT_TRUE(life.alive(3, 2));
    EXPECT_FALSE(life.alive(2, 1));
    EXPECT_FALSE(life.alive(2, 3));
    EXPECT_EQ(life.population(), 3);

    life.step();
    EXPECT_TRUE(life.snapshot() == start);
}

TEST(LifeTest, BlockIsStill)
{
    for (EdgePolicy edge : {EDGE_TORUS, EDGE_DEAD}) {
        Life life(grid({"....",
                        ".##.",
                        ".##.",
                        "...."}), withEdge(edge));
        const Pattern start = life.snapshot();

        life.step(3);
        EXPECT_TRUE(life.snapshot() == start);
    }
}

TEST(LifeTest, EdgePolicyChangesSmallGrid)
{
    // On a full 2x2 torus every cell counts eight live neighbours.
    Life torus(grid({"##", "##"}), withEdge(EDGE_TORUS));
    torus.step();
    EXPECT_EQ(torus.population(), 0);

    Life bounded(grid({"##", "##"}), withEdge(EDGE_DEAD));
    bounded.step();
    EXPECT_EQ(bounded.population(), 4);
}

TEST(LifeTest, GliderWrapsOnTorusOnly)
{
    const auto glider = grid({".#......",
                              "..#.....",
                              "###.....",
                              "........",
                              "........",
                              "........",
                              "........",
                              "........"});

    // A glider moves one cell diagonally every four generations.
    Life torus(glider, withEdge(EDGE_TORUS));
    torus.step(32);
    EXPECT_TRUE(torus.snapshot() == Life(glider).snapshot());
    EXPECT_EQ(torus.population(), 5);

    // Without wrapping it settles into a block in the far corner.
    Life bounded(glider, withEdge(EDGE_DEAD));
    bounded.step(32);
    EXPECT_EQ(bounded.population(), 4);
    EXPECT_TRUE(bounded.alive(6, 6));
    EXPECT_TRUE(bounded.alive(7, 6));
    EXPECT_TRUE(bounded.alive(6, 7));
    EXPECT_TRUE(bounded.alive(7, 7));
}

TEST(LifeTest, SameSeedSameHistory)
{
    Life a(32, 24, 1234u);
    Life b(32, 24, 1234u);
    EXPECT_TRUE(a.snapshot() == b.snapshot());

    for (int t = 0; t < 5; ++t) {
        a.step();
        b.step();
        EXPECT_TRUE(a.snapshot() == b.snapshot());
        EXPECT_EQ(a.population(), b.population());
    }
}

TEST(LifeTest, RandomSeedHasRequestedShape)
{
    Life life(17, 9);
    EXPECT_EQ(life.cols(), 17);
    EXPECT_EQ(life.rows(), 9);
    EXPECT_EQ(life.generation(), 0u);
    EXPECT_EQ(life.edge(), EDGE_TORUS);
    EXPECT_LE(life.population(), 17 * 9 / 4);
}

TEST(LifeTest, SeedFillControlsPlacements)
{
    LifeParameters empty;
    empty.fill = 0.0;
    EXPECT_EQ(Life(10, 10, 5u, empty).population(), 0);

    // 25 placements drawn with replacement.
    const long seeded = Life(10, 10, 5u).population();
    EXPECT_GT(seeded, 0);
    EXPECT_LE(seeded, 25);

    LifeParameters bad;
    bad.fill = -0.5;
    EXPECT_THROW(Life(10, 10, 5u, bad), std::invalid_argument);

    LifeParameters huge;
    huge.fill = 1e30;
    EXPECT_THROW(Life(4, 4, 1u, huge), std::invalid_argument);
    huge.fill = 1.5;
    EXPECT_THROW(Life(4, 4, huge), std::invalid_argument);

    LifeParameters full;
    full.fill = 1.0;
    EXPECT_LE(Life(4, 4, 1u, full).population(), 16);
}

TEST(LifeTest, SnapshotRoundTrip)
{
    Life original(20, 15, 7u);
    original.step(10);

    Life copy(original.snapshot(), original.parameters());
    EXPECT_EQ(copy.generation(), 0u);

    original.step();
    copy.step();
    EXPECT_TRUE(original.snapshot() == copy.snapshot());
}

TEST(LifeTest, AliveOutOfBoundsThrows)
{
    Life life(4, 3, 1u);
    const int coords[][2] = {
        {-1, 0}, {0, -1}, {4, 0}, {0, 3}, {4, 3}, {-1, -1},
        {1000, 1}, {1, -1000}, {INT_MAX, 0}, {0, INT_MIN}
    };

    for (const auto& c : coords)
        EXPECT_THROW(life.alive(c[0], c[1]), OutOfBounds)
            << "(" << c[0] << ", " << c[1] << ")";

    EXPECT_NO_THROW(life.alive(0, 0));
    EXPECT_NO_THROW(life.alive(3, 2));
}

TEST(LifeTest, InvalidDimensionsThrow)
{
    EXPECT_THROW(Life(0, 5), InvalidDimensions);
    EXPECT_THROW(Life(5, -1), InvalidDimensions);
    EXPECT_THROW(Life(-3, 0, 9u), InvalidDimensions);
    const std::vector<std::vector<int>> none;
    EXPECT_THROW(Life(none, LifeParameters()), InvalidDimensions);
    EXPECT_THROW(Life(Pattern(), LifeParameters()), InvalidDimensions);
}

TEST(LifeTest, MalformedPatternThrows)
{
    EXPECT_THROW(Life(grid({"##.", "#."})), std::invalid_argument);

    std::vector<std::vector<int>> twos = {std::vector<int>{0, 2}};
    EXPECT_THROW(Life(twos, LifeParameters()), std::invalid_argument);

    Pattern p = Pattern::Zero(2, 2);
    p(1, 1) = 7;
    EXPECT_THROW(Life(p, LifeParameters()), std::invalid_argument);
}

TEST(LifeTest, NegativeStepCountThrows)
{
    Life life(3, 3, 2u);
    EXPECT_THROW(life.step(-1), std::invalid_argument);
    EXPECT_EQ(life.generation(), 0u);

    life.step(0);
    EXPECT_EQ(life.generation(), 0u);
}

TEST(LifeTest, SnapshotIsRowMajor)
{
    Life life(grid({"#..", "..#"}));
    const Pattern p = life.snapshot();

    ASSERT_EQ(p.rows(), 2);
    ASSERT_EQ(p.cols(), 3);
    EXPECT_EQ(p(0, 0), CELL_ALIVE);
    EXPECT_EQ(p(1, 2), CELL_ALIVE);
    EXPECT_EQ(p(0, 2), CELL_DEAD);
    EXPECT_TRUE(life.alive(2, 1));
}

TEST(LifeTest, ToStringDrawsRows)
{
    Life life(grid({"#.#", ".#."}));
    EXPECT_EQ(life.toString(), "* *\n * \n");
}
