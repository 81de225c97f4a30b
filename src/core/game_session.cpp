/**
 * @file game_session.cpp
 * @brief Implementation of GameSession.
 */

#include "asteroids/core/game_session.hpp"

#include <algorithm>
#include <iostream>

#include "asteroids/components/basic.hpp"
#include "asteroids/components/game.hpp"
#include "asteroids/core/debug.hpp"
#include "asteroids/core/profile.hpp"
#include "asteroids/entities/entity_factory.hpp"
#include "asteroids/systems/cleanup.hpp"
#include "asteroids/systems/collision.hpp"
#include "asteroids/systems/lifetime.hpp"
#include "asteroids/systems/movement.hpp"
#include "asteroids/systems/ship_control.hpp"

namespace {

const GameConfig& validated(const GameConfig& config) {
  validateConfig(config);
  return config;
}

}  // namespace

GameSession::GameSession(const GameConfig& config)
    : cfg(validated(config))
    , registry()
    , rng(config.seed)
{
  // Create every pool up front so const views never see a missing storage
  registry.storage<Components::Kind>();
  registry.storage<Components::EntityId>();
  registry.storage<Components::Position>();
  registry.storage<Components::Velocity>();
  registry.storage<Components::Heading>();
  registry.storage<Components::Radius>();
  registry.storage<Components::Dead>();
  registry.storage<Components::Ship>();
  registry.storage<Components::Asteroid>();
  registry.storage<Components::Bullet>();
  registry.storage<Components::PowerUp>();

  Entities::EntityFactory::createSessionState(registry);
  Entities::EntityFactory::createShip(registry, cfg,
      Components::Position(cfg.screenWidth * 0.5, cfg.screenHeight * 0.5));

  createSystems();

  std::cout << "GameSession created (" << cfg.screenWidth << "x" << cfg.screenHeight
            << ", seed " << cfg.seed << ")" << std::endl;

  waveSystem->startNextWave(registry, rng);
}

GameSession::~GameSession() = default;

void GameSession::createSystems() {
  systems.clear();

  systems.push_back(std::make_unique<Systems::ShipControlSystem>());
  systems.push_back(std::make_unique<Systems::MovementSystem>());
  systems.push_back(std::make_unique<Systems::LifetimeSystem>());
  systems.push_back(std::make_unique<Systems::CollisionSystem>());
  systems.push_back(std::make_unique<Systems::CleanupSystem>());

  auto wave = std::make_unique<Systems::WaveSystem>();
  waveSystem = wave.get();
  systems.push_back(std::move(wave));

  for (auto& system : systems) {
    system->setGameConfig(cfg);
  }
}

void GameSession::advance(const InputIntents& intents, double dt) {
  PROFILE_SCOPE("GameSession::advance");

  auto& session = Entities::sessionState(registry);
  if (session.state != Components::GameState::Playing) {
    return;
  }

  // Also rejects NaN
  if (!(dt > 0.0)) {
    return;
  }
  double const step = std::min(dt, cfg.maxTickSeconds);

  session.tick += 1;
  Systems::TickContext ctx{step, intents, session.tick, rng};

  // Update all systems in order
  for (auto& system : systems) {
    system->update(registry, ctx);
  }

  auto& after = Entities::sessionState(registry);
  after.stats.timeSurvived += step;

  if (after.state == Components::GameState::GameOver) {
    std::cout << "[GameSession] Game over at tick " << after.tick << ": score " << after.score
              << ", wave " << after.wave << ", asteroids destroyed "
              << after.stats.asteroidsDestroyed << std::endl;
    DebugStats::printCollisionStats();
  }
}

void GameSession::pause() {
  auto& session = Entities::sessionState(registry);
  if (session.state == Components::GameState::Playing) {
    session.state = Components::GameState::Paused;
  }
}

void GameSession::resume() {
  auto& session = Entities::sessionState(registry);
  if (session.state == Components::GameState::Paused) {
    session.state = Components::GameState::Playing;
  }
}

RenderSnapshot GameSession::snapshot() const {
  const auto& session = Entities::sessionState(registry);

  RenderSnapshot snap;
  snap.score = session.score;
  snap.wave = session.wave;
  snap.state = session.state;
  snap.tick = session.tick;
  snap.stats = session.stats;

  auto view = registry.view<const Components::Kind, const Components::EntityId,
                            const Components::Position, const Components::Heading,
                            const Components::Radius>(entt::exclude<Components::Dead>);

  for (auto [entity, kind, id, pos, heading, radius] : view.each()) {
    EntitySnapshot es;
    es.id = id.value;
    es.kind = kind.value;
    es.position = pos;
    es.heading = heading.angle;
    es.radius = radius.value;

    switch (kind.value) {
      case Components::EntityKind::Ship: {
        const auto& ship = registry.get<Components::Ship>(entity);
        es.invulnerable = ship.isInvulnerable(session.tick);
        es.thrusting = ship.thrusting;
        snap.lives = ship.lives;
        snap.ammo = ship.ammo;
        break;
      }
      case Components::EntityKind::Asteroid:
        es.tier = registry.get<Components::Asteroid>(entity).tier;
        break;
      case Components::EntityKind::PowerUp:
        es.powerUp = registry.get<Components::PowerUp>(entity).type;
        break;
      case Components::EntityKind::Bullet:
        break;
    }
    snap.entities.push_back(es);
  }

  std::sort(snap.entities.begin(), snap.entities.end(),
            [](const EntitySnapshot& a, const EntitySnapshot& b) { return a.id < b.id; });
  return snap;
}

int GameSession::score() const {
  return Entities::sessionState(registry).score;
}

int GameSession::wave() const {
  return Entities::sessionState(registry).wave;
}

int GameSession::lives() const {
  entt::entity const ship = Entities::findShip(registry);
  return ship == entt::null ? 0 : registry.get<Components::Ship>(ship).lives;
}

std::uint64_t GameSession::tick() const {
  return Entities::sessionState(registry).tick;
}

Components::GameState GameSession::state() const {
  return Entities::sessionState(registry).state;
}

const Components::SessionStats& GameSession::stats() const {
  return Entities::sessionState(registry).stats;
}
