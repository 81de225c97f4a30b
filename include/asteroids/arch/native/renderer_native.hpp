/**
 * @file renderer_native.hpp
 * @brief Draws a RenderSnapshot with SFML
 *
 * This adapter handles:
 * - Window creation and frame presentation
 * - Outline rendering of the ship, asteroids, bullets and power-ups
 * - HUD text (score, lives, wave, ammo, high score, state banners, FPS)
 *
 * It only reads snapshots; it never touches the game session.
 */

#pragma once

#include <string>
#include <SFML/Graphics.hpp>

#include "asteroids/core/snapshot.hpp"

/**
 * @class Renderer
 * @brief Owns the SFML window and turns snapshots into draw calls
 */
class Renderer {
public:
    /**
     * @brief Constructs renderer with given screen dimensions
     * @param screenWidth Width of the window
     * @param screenHeight Height of the window
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Initializes SFML window and loads font
     * @return true if success, false otherwise
     */
    bool init();

    /** Clears the screen to black */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Draws every entity of the snapshot
     *
     * Entities near an edge are drawn a second time on the opposite side so
     * they appear to slide across the wrap.
     */
    void renderEntities(const RenderSnapshot& snapshot);

    /**
     * @brief Draws score, lives, wave and the pause / game over banners
     */
    void renderHud(const RenderSnapshot& snapshot);

    /**
     * @brief Renders the current FPS in the top-right corner
     */
    void renderFPS(float fps);

    /**
     * @brief Renders text at an (x,y) in the window
     */
    void renderText(const std::string& text, int x, int y,
                    sf::Color color = sf::Color::White, unsigned int size = 16);

    /** Returns the SFML window so external code can process events */
    sf::RenderWindow& getWindow() { return window; }

    /** @brief True if we successfully called init() */
    bool isInitialized() const { return initialized; }

private:
    void drawEntity(const EntitySnapshot& entity, float x, float y, unsigned int frame);
    void drawShip(const EntitySnapshot& ship, float x, float y, unsigned int frame);

    sf::RenderWindow window;
    sf::Font font;
    bool initialized;
    int screenWidth;
    int screenHeight;
};
