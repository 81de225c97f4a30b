#include "asteroids/arch/native/input_native.hpp"

#include <SFML/Window/Event.hpp>
#include <SFML/Window/Keyboard.hpp>

InputIntents InputNative::poll(sf::RenderWindow& window)
{
    InputIntents intents;

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            closed = true;
            intents.quit = true;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    intents.quit = true;
                    break;
                case sf::Keyboard::P:
                    intents.pause = true;
                    break;
                case sf::Keyboard::R:
                    intents.restart = true;
                    break;
                default:
                    break;
            }
        }
    }

    // Ignore held keys when another window has focus
    if (!window.hasFocus())
    {
        return intents;
    }

    intents.thrust = sf::Keyboard::isKeyPressed(sf::Keyboard::W) ||
                     sf::Keyboard::isKeyPressed(sf::Keyboard::Up);
    intents.rotateLeft = sf::Keyboard::isKeyPressed(sf::Keyboard::A) ||
                         sf::Keyboard::isKeyPressed(sf::Keyboard::Left);
    intents.rotateRight = sf::Keyboard::isKeyPressed(sf::Keyboard::D) ||
                          sf::Keyboard::isKeyPressed(sf::Keyboard::Right);
    intents.fire = sf::Keyboard::isKeyPressed(sf::Keyboard::Space);

    return intents;
}
