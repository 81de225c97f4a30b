/**
 * @file input_native.hpp
 * @brief Translates SFML keyboard state into InputIntents
 */

#pragma once

#include <SFML/Graphics/RenderWindow.hpp>

#include "asteroids/core/input_intents.hpp"

/**
 * @class InputNative
 * @brief Polls window events once per frame
 *
 * Held keys (thrust, rotation, fire) are sampled every frame. Pause, restart
 * and quit fire once per key press so holding P does not flicker the pause
 * state.
 */
class InputNative {
public:
    /**
     * @brief Drains the event queue and samples held keys
     * @return Intents for this frame
     */
    InputIntents poll(sf::RenderWindow& window);

    /** @brief True once the window close button was pressed */
    bool closeRequested() const { return closed; }

private:
    bool closed = false;
};
