#include <gtest/gtest.h>
#include "asteroids/core/high_scores.hpp"

TEST(HighScoreTableTest, EmptyTable) {
    HighScoreTable table;
    EXPECT_EQ(table.capacity(), 10u);
    EXPECT_EQ(table.best(), 0);
    EXPECT_TRUE(table.entries().empty());
    EXPECT_TRUE(table.qualifies(0));
}

TEST(HighScoreTableTest, KeepsHighestFirst) {
    HighScoreTable table;
    EXPECT_EQ(table.record("A", 300, 2), 0);
    EXPECT_EQ(table.record("B", 900, 4), 0);
    EXPECT_EQ(table.record("C", 500, 3), 1);

    const auto& e = table.entries();
    ASSERT_EQ(e.size(), 3u);
    EXPECT_EQ(e[0].name, "B");
    EXPECT_EQ(e[1].name, "C");
    EXPECT_EQ(e[2].name, "A");
    EXPECT_EQ(table.best(), 900);
}

TEST(HighScoreTableTest, TiesKeepInsertionOrder) {
    HighScoreTable table;
    table.record("FIRST", 400, 1);
    EXPECT_EQ(table.record("SECOND", 400, 1), 1);
    EXPECT_EQ(table.entries()[0].name, "FIRST");
    EXPECT_EQ(table.entries()[1].name, "SECOND");
}

TEST(HighScoreTableTest, EvictsLowestWhenFull) {
    HighScoreTable table(3);
    table.record("A", 100, 1);
    table.record("B", 200, 1);
    table.record("C", 300, 1);

    EXPECT_FALSE(table.qualifies(100));
    EXPECT_EQ(table.record("D", 100, 1), -1);
    EXPECT_EQ(table.record("E", 150, 1), 2);

    const auto& e = table.entries();
    ASSERT_EQ(e.size(), 3u);
    EXPECT_EQ(e[2].name, "E");
    EXPECT_EQ(e[2].score, 150);
}

TEST(HighScoreTableTest, ZeroCapacityRecordsNothing) {
    HighScoreTable table(0);
    EXPECT_FALSE(table.qualifies(1000));
    EXPECT_EQ(table.record("A", 1000, 1), -1);
    EXPECT_TRUE(table.entries().empty());
}
