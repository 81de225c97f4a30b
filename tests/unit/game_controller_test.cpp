#include <gtest/gtest.h>

#include "asteroids/core/game_controller.hpp"
#include "session_fixture.hpp"

using namespace TestSupport;

namespace {

InputIntents pausePressed() {
    InputIntents in;
    in.pause = true;
    return in;
}

InputIntents restartPressed() {
    InputIntents in;
    in.restart = true;
    return in;
}

InputIntents quitPressed() {
    InputIntents in;
    in.quit = true;
    return in;
}

/// Puts an asteroid on the ship of the controller's current session
void crashShip(GameController& controller) {
    GameSession& session = controller.session();
    Entities::EntityFactory::createAsteroid(session.getRegistry(), shipPosition(session), Vector(),
                                            Components::AsteroidTier::Large, 40.0);
}

} // namespace

class GameControllerTest : public ::testing::Test {
protected:
    GameControllerTest() : controller(quietConfig(100)) {}

    GameController controller;
};

TEST_F(GameControllerTest, StartsPlaying) {
    EXPECT_TRUE(controller.isRunning());
    EXPECT_EQ(controller.state(), Components::GameState::Playing);
    EXPECT_EQ(controller.restartCount(), 0);
    EXPECT_EQ(controller.session().wave(), 1);
}

TEST_F(GameControllerTest, PlayingAdvancesTheSession) {
    controller.update({}, kTick);
    controller.update({}, kTick);
    EXPECT_EQ(controller.session().tick(), 2u);
}

TEST_F(GameControllerTest, PauseTogglesAndFreezesGameplay) {
    controller.update(pausePressed(), kTick);
    EXPECT_EQ(controller.state(), Components::GameState::Paused);
    std::uint64_t const tick = controller.session().tick();

    InputIntents play;
    play.thrust = true;
    play.fire = true;
    for (int i = 0; i < 10; ++i) {
        controller.update(play, kTick);
    }
    EXPECT_EQ(controller.session().tick(), tick);
    EXPECT_EQ(controller.session().stats().shotsFired, 0);

    controller.update(pausePressed(), kTick);
    EXPECT_EQ(controller.state(), Components::GameState::Playing);
    controller.update(play, kTick);
    EXPECT_EQ(controller.session().tick(), tick + 1);
}

TEST_F(GameControllerTest, RestartBuildsFreshSessionWithNextSeed) {
    for (int i = 0; i < 30; ++i) {
        controller.update({}, kTick);
    }
    controller.update(pausePressed(), kTick);
    controller.update(restartPressed(), kTick);

    EXPECT_EQ(controller.state(), Components::GameState::Playing);
    EXPECT_EQ(controller.restartCount(), 1);
    EXPECT_EQ(controller.session().tick(), 0u);
    EXPECT_EQ(controller.session().wave(), 1);
    EXPECT_EQ(controller.session().score(), 0);
    EXPECT_EQ(controller.session().config().seed, 101u);
}

TEST_F(GameControllerTest, QuitStopsFurtherUpdates) {
    controller.update(quitPressed(), kTick);
    EXPECT_FALSE(controller.isRunning());

    controller.update({}, kTick);
    controller.update(restartPressed(), kTick);
    EXPECT_EQ(controller.session().tick(), 0u);
    EXPECT_EQ(controller.restartCount(), 0);
}

TEST(GameControllerGameOverTest, GameOverIsRecordedOnceAndRestartable) {
    GameConfig cfg = quietConfig();
    cfg.ship.initialLives = 0;
    GameController controller(cfg, "ACE");

    crashShip(controller);
    controller.update({}, kTick);
    ASSERT_EQ(controller.state(), Components::GameState::GameOver);
    ASSERT_EQ(controller.highScores().entries().size(), 1u);
    EXPECT_EQ(controller.highScores().entries()[0].name, "ACE");
    EXPECT_EQ(controller.highScores().entries()[0].wave, 1);

    // Gameplay and pause are ignored after game over
    std::uint64_t const tick = controller.session().tick();
    controller.update(pausePressed(), kTick);
    controller.update({}, kTick);
    EXPECT_EQ(controller.state(), Components::GameState::GameOver);
    EXPECT_EQ(controller.session().tick(), tick);
    EXPECT_EQ(controller.highScores().entries().size(), 1u);

    controller.update(restartPressed(), kTick);
    EXPECT_EQ(controller.state(), Components::GameState::Playing);

    crashShip(controller);
    controller.update({}, kTick);
    EXPECT_EQ(controller.state(), Components::GameState::GameOver);
    EXPECT_EQ(controller.highScores().entries().size(), 2u);
}

TEST(GameControllerGameOverTest, SnapshotCarriesBestScore) {
    GameConfig cfg = quietConfig();
    cfg.ship.initialLives = 0;
    GameController controller(cfg);

    // Score 100 and then lose the only life
    GameSession& session = controller.session();
    auto& registry = session.getRegistry();
    parkAsteroid(session);
    Entities::EntityFactory::createAsteroid(registry, Position(600.0, 450.0), Vector(),
                                            Components::AsteroidTier::Small, 10.0);
    Entities::EntityFactory::createBullet(registry, cfg.bullet, Position(600.0, 450.0), Vector(), 0.0);
    crashShip(controller);
    controller.update({}, kTick);
    ASSERT_EQ(controller.state(), Components::GameState::GameOver);
    EXPECT_EQ(controller.highScores().best(), 100);

    controller.restart();
    RenderSnapshot const snap = controller.snapshot();
    EXPECT_EQ(snap.score, 0);
    EXPECT_EQ(snap.highScore, 100);
}
