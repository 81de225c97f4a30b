#include <gtest/gtest.h>
#include <random>

#include "asteroids/systems/wave.hpp"
#include "session_fixture.hpp"

using namespace TestSupport;

class WaveSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = quietConfig();
        Entities::EntityFactory::createSessionState(registry);
        wave.setGameConfig(config);
    }

    entt::registry registry;
    GameConfig config;
    Systems::WaveSystem wave;
    std::mt19937 rng{7};
};

TEST_F(WaveSystemTest, EachWaveAddsOneAsteroid) {
    EXPECT_EQ(wave.startNextWave(registry, rng), config.asteroids.initialCount + 1);
    EXPECT_EQ(Entities::sessionState(registry).wave, 1);

    EXPECT_EQ(wave.startNextWave(registry, rng), config.asteroids.initialCount + 2);
    EXPECT_EQ(Entities::sessionState(registry).wave, 2);
    EXPECT_EQ(Entities::countAsteroids(registry),
              static_cast<std::size_t>(2 * config.asteroids.initialCount + 3));
}

TEST_F(WaveSystemTest, SpawnsLargeAsteroidsAwayFromCentre) {
    for (int i = 0; i < 5; ++i) {
        wave.startNextWave(registry, rng);
    }

    Position const centre(config.screenWidth * 0.5, config.screenHeight * 0.5);
    auto view = registry.view<const Components::Asteroid, const Components::Position,
                              const Components::Radius, const Components::Velocity>();
    for (auto [entity, asteroid, pos, radius, vel] : view.each()) {
        EXPECT_EQ(asteroid.tier, Components::AsteroidTier::Large);
        EXPECT_DOUBLE_EQ(radius.value, config.asteroids.largeRadius);
        EXPECT_GE(toroidalDistance(pos, centre, config.screenWidth, config.screenHeight),
                  config.asteroids.safeSpawnRadius);
        EXPECT_GE(vel.length(), config.asteroids.minSpeed - 1e-9);
        EXPECT_LE(vel.length(), config.asteroids.maxSpeed + 1e-9);
    }
}

TEST_F(WaveSystemTest, SpawnsAwayFromRelocatedShip) {
    Position const shipAt(120.0, 100.0);
    Entities::EntityFactory::createShip(registry, config, shipAt);

    wave.startNextWave(registry, rng);

    auto view = registry.view<const Components::Asteroid, const Components::Position>();
    for (auto [entity, asteroid, pos] : view.each()) {
        EXPECT_GE(toroidalDistance(pos, shipAt, config.screenWidth, config.screenHeight),
                  config.asteroids.safeSpawnRadius);
    }
}

TEST(WaveProgressionTest, ClearingTheFieldStartsNextWave) {
    GameSession session(quietConfig());
    auto& registry = session.getRegistry();

    destroyAll(registry, Components::EntityKind::Asteroid);
    session.advance({}, kTick);

    EXPECT_EQ(session.wave(), 2);
    EXPECT_EQ(Entities::countAsteroids(registry),
              static_cast<std::size_t>(session.config().asteroids.initialCount + 2));
}

TEST(WaveProgressionTest, HardPresetSpawnsMoreAsteroids) {
    GameConfig cfg = configForDifficulty(GameConstants::Difficulty::HARD);
    cfg.powerUps.enabled = false;
    GameSession session(cfg);

    GameConfig const normal;
    EXPECT_EQ(Entities::countAsteroids(session.getRegistry()),
              static_cast<std::size_t>(normal.asteroids.initialCount + 2 + 1));
}
