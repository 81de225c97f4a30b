#include "asteroids/arch/native/renderer_native.hpp"
#include "asteroids/core/constants.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

sf::Color powerUpColor(Components::PowerUpType type) {
    switch (type) {
        case Components::PowerUpType::Ammo:      return {0, 200, 0};
        case Components::PowerUpType::RapidFire: return {255, 215, 0};
        case Components::PowerUpType::Shield:    return {0, 100, 255};
    }
    return sf::Color::White;
}

std::string stateBanner(Components::GameState state) {
    switch (state) {
        case Components::GameState::Paused:   return "PAUSED - press P to resume";
        case Components::GameState::GameOver: return "GAME OVER - press R to restart";
        case Components::GameState::Playing:  return "";
    }
    return "";
}

} // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : initialized(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Asteroids");
    window.setVerticalSyncEnabled(true);

    // Load a font for the HUD, bundled asset first
    const char* const fontPaths[] = {
        "assets/fonts/arial.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    for (const char* path : fontPaths) {
        if (font.loadFromFile(path)) {
            initialized = true;
            return true;
        }
    }
    std::cerr << "Failed to load a HUD font (tried assets/fonts/arial.ttf)\n";
    return false;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::drawShip(const EntitySnapshot& ship, float x, float y, unsigned int frame) {
    // Blink while invulnerable
    if (ship.invulnerable && (frame / 6) % 2 == 0) {
        return;
    }

    const auto r = static_cast<float>(ship.radius);
    const auto rotation = static_cast<float>(GameConstants::radiansToDegrees(ship.heading));

    // Exhaust is drawn on three of every four frames
    if (ship.thrusting && frame % 4 < 3) {
        sf::ConvexShape flame(3);
        flame.setPoint(0, sf::Vector2f(-r * 0.8f, -r * 0.35f));
        flame.setPoint(1, sf::Vector2f(-r * 1.6f, 0.0f));
        flame.setPoint(2, sf::Vector2f(-r * 0.8f, r * 0.35f));
        flame.setFillColor(sf::Color(255, 140, 0));
        flame.setPosition(x, y);
        flame.setRotation(rotation);
        window.draw(flame);
    }

    sf::ConvexShape hull(3);
    hull.setPoint(0, sf::Vector2f(r, 0.0f));
    hull.setPoint(1, sf::Vector2f(-r * 0.8f, -r * 0.6f));
    hull.setPoint(2, sf::Vector2f(-r * 0.8f, r * 0.6f));
    hull.setFillColor(sf::Color::Transparent);
    hull.setOutlineColor(ship.invulnerable ? sf::Color(0, 100, 255) : sf::Color::White);
    hull.setOutlineThickness(1.5f);
    hull.setPosition(x, y);
    hull.setRotation(rotation);
    window.draw(hull);
}

void Renderer::drawEntity(const EntitySnapshot& entity, float x, float y, unsigned int frame) {
    const auto r = static_cast<float>(entity.radius);

    switch (entity.kind) {
        case Components::EntityKind::Ship:
            drawShip(entity, x, y, frame);
            break;
        case Components::EntityKind::Asteroid: {
            sf::CircleShape rock(r, 10);
            rock.setOrigin(r, r);
            rock.setPosition(x, y);
            rock.setRotation(static_cast<float>(GameConstants::radiansToDegrees(entity.heading)));
            rock.setFillColor(sf::Color::Transparent);
            rock.setOutlineColor(sf::Color(225, 225, 225));
            rock.setOutlineThickness(2.0f);
            window.draw(rock);
            break;
        }
        case Components::EntityKind::Bullet: {
            sf::CircleShape shot(r);
            shot.setOrigin(r, r);
            shot.setPosition(x, y);
            shot.setFillColor(sf::Color(225, 225, 0));
            window.draw(shot);
            break;
        }
        case Components::EntityKind::PowerUp: {
            // Pulse between 0.8 and 1.2 of the pickup radius
            float const pulse = 1.0f + 0.2f * std::sin(static_cast<float>(frame) * 0.1f);
            sf::CircleShape pickup(r * pulse);
            pickup.setOrigin(r * pulse, r * pulse);
            pickup.setPosition(x, y);
            pickup.setFillColor(sf::Color::Transparent);
            pickup.setOutlineColor(powerUpColor(entity.powerUp));
            pickup.setOutlineThickness(2.0f);
            window.draw(pickup);
            break;
        }
    }
}

void Renderer::renderEntities(const RenderSnapshot& snapshot) {
    auto const frame = static_cast<unsigned int>(snapshot.tick);
    auto const w = static_cast<float>(screenWidth);
    auto const h = static_cast<float>(screenHeight);

    for (const auto& entity : snapshot.entities) {
        auto const x = static_cast<float>(entity.position.x);
        auto const y = static_cast<float>(entity.position.y);
        auto const r = static_cast<float>(entity.radius);

        drawEntity(entity, x, y, frame);

        // Ghost copies across the wrap boundary
        float const gx = x < r ? x + w : (x > w - r ? x - w : x);
        float const gy = y < r ? y + h : (y > h - r ? y - h : y);
        if (gx != x) {
            drawEntity(entity, gx, y, frame);
        }
        if (gy != y) {
            drawEntity(entity, x, gy, frame);
        }
        if (gx != x && gy != y) {
            drawEntity(entity, gx, gy, frame);
        }
    }
}

void Renderer::renderHud(const RenderSnapshot& snapshot) {
    std::stringstream ss;
    ss << "Score: " << snapshot.score
       << "   Lives: " << std::max(snapshot.lives, 0)
       << "   Wave: " << snapshot.wave
       << "   Ammo: " << snapshot.ammo;
    renderText(ss.str(), 10, 10);

    std::stringstream hs;
    hs << "High Score: " << snapshot.highScore;
    renderText(hs.str(), 10, 30, sf::Color(255, 215, 0));

    std::string const banner = stateBanner(snapshot.state);
    if (!banner.empty()) {
        renderText(banner, screenWidth / 2 - 180, screenHeight / 2 - 40, sf::Color::White, 24);
    }

    if (snapshot.state == Components::GameState::GameOver) {
        std::stringstream stats;
        int const minutes = static_cast<int>(snapshot.stats.timeSurvived) / 60;
        int const seconds = static_cast<int>(snapshot.stats.timeSurvived) % 60;
        stats << "Asteroids destroyed: " << snapshot.stats.asteroidsDestroyed
              << "   Shots fired: " << snapshot.stats.shotsFired
              << "   Time: " << minutes << ":" << std::setw(2) << std::setfill('0') << seconds;
        renderText(stats.str(), screenWidth / 2 - 220, screenHeight / 2, sf::Color(200, 200, 200));
    }
}

void Renderer::renderFPS(float fps) {
    // Display fps with one decimal place
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), screenWidth - 90, 10, sf::Color(150, 150, 150));
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color, unsigned int size) {
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
