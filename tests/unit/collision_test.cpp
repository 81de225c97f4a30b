#include <gtest/gtest.h>
#include <utility>
#include "asteroids/systems/collision.hpp"

using namespace Systems;

namespace {

constexpr double W = 800.0;
constexpr double H = 600.0;

using Hit = std::pair<std::uint64_t, std::uint64_t>;

CollisionBody body(std::uint64_t id, double x, double y, double r) {
    return CollisionBody{id, Position(x, y), r};
}

} // namespace

TEST(CollisionTest, TouchingCirclesOverlap) {
    EXPECT_TRUE(overlaps(body(1, 100, 100, 10), body(2, 120, 100, 10), W, H));
    EXPECT_FALSE(overlaps(body(1, 100, 100, 10), body(2, 120.5, 100, 10), W, H));
}

TEST(CollisionTest, OverlapAcrossTheSeam) {
    // 10 units apart through the left/right edge, 790 apart on screen
    EXPECT_TRUE(overlaps(body(1, 795, 300, 6), body(2, 5, 300, 6), W, H));
    EXPECT_TRUE(overlaps(body(1, 400, 2, 3), body(2, 400, 598, 3), W, H));
}

TEST(CollisionTest, BulletResolvesAgainstLowestIdAsteroid) {
    std::vector<CollisionBody> asteroids{body(7, 100, 100, 20), body(3, 110, 100, 20)};
    std::vector<CollisionBody> bullets{body(9, 105, 100, 2)};

    CollisionResult r = findCollisions(asteroids, bullets, nullptr, {}, W, H);
    ASSERT_EQ(r.bulletHits.size(), 1u);
    EXPECT_EQ(r.bulletHits[0].first, 9u);
    EXPECT_EQ(r.bulletHits[0].second, 3u);
}

TEST(CollisionTest, LaterBulletTakesNextUnclaimedAsteroid) {
    std::vector<CollisionBody> asteroids{body(3, 100, 100, 20), body(4, 110, 100, 20)};
    // Input order is not id order
    std::vector<CollisionBody> bullets{body(12, 105, 100, 2), body(10, 105, 100, 2)};

    CollisionResult r = findCollisions(asteroids, bullets, nullptr, {}, W, H);
    ASSERT_EQ(r.bulletHits.size(), 2u);
    EXPECT_EQ(r.bulletHits[0], Hit(10, 3));
    EXPECT_EQ(r.bulletHits[1], Hit(12, 4));
}

TEST(CollisionTest, BulletWithNothingLeftToClaimSurvives) {
    std::vector<CollisionBody> asteroids{body(3, 100, 100, 20)};
    std::vector<CollisionBody> bullets{body(10, 100, 100, 2), body(11, 101, 100, 2)};

    CollisionResult r = findCollisions(asteroids, bullets, nullptr, {}, W, H);
    ASSERT_EQ(r.bulletHits.size(), 1u);
    EXPECT_EQ(r.bulletHits[0].first, 10u);
}

TEST(CollisionTest, ShipHitsSkipAsteroidsShotThisTick) {
    std::vector<CollisionBody> asteroids{body(2, 400, 300, 20), body(5, 420, 300, 20)};
    std::vector<CollisionBody> bullets{body(8, 400, 300, 2)};
    CollisionBody ship = body(1, 410, 300, 15);

    CollisionResult r = findCollisions(asteroids, bullets, &ship, {}, W, H);
    ASSERT_EQ(r.bulletHits.size(), 1u);
    EXPECT_EQ(r.bulletHits[0].second, 2u);
    ASSERT_EQ(r.shipHits.size(), 1u);
    EXPECT_EQ(r.shipHits[0], 5u);
}

TEST(CollisionTest, PickupsSortedById) {
    CollisionBody ship = body(1, 400, 300, 15);
    std::vector<CollisionBody> powerUps{
        body(30, 410, 300, 10), body(20, 390, 300, 10), body(40, 600, 300, 10)};

    CollisionResult r = findCollisions({}, {}, &ship, powerUps, W, H);
    ASSERT_EQ(r.pickups.size(), 2u);
    EXPECT_EQ(r.pickups[0], 20u);
    EXPECT_EQ(r.pickups[1], 30u);
    EXPECT_TRUE(r.shipHits.empty());
}

TEST(CollisionTest, NoShipMeansNoShipContacts) {
    std::vector<CollisionBody> asteroids{body(2, 400, 300, 20)};
    std::vector<CollisionBody> powerUps{body(3, 400, 300, 10)};

    CollisionResult r = findCollisions(asteroids, {}, nullptr, powerUps, W, H);
    EXPECT_TRUE(r.bulletHits.empty());
    EXPECT_TRUE(r.shipHits.empty());
    EXPECT_TRUE(r.pickups.empty());
}

TEST(CollisionTest, ScoreTable) {
    EXPECT_EQ(scoreForTier(Components::AsteroidTier::Large), 20);
    EXPECT_EQ(scoreForTier(Components::AsteroidTier::Medium), 50);
    EXPECT_EQ(scoreForTier(Components::AsteroidTier::Small), 100);
}
