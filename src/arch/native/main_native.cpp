/**
 * @file main_native.cpp
 * @brief Main entry point for the native platform.
 *
 * Creates the SFML renderer and a GameController, then runs a fixed timestep
 * loop until the player quits or closes the window.
 *
 * Usage: asteroids_native [easy|normal|hard]
 */

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <string>

#include <SFML/System/Clock.hpp>

#include "asteroids/arch/native/input_native.hpp"
#include "asteroids/arch/native/renderer_native.hpp"
#include "asteroids/core/constants.hpp"
#include "asteroids/core/errors.hpp"
#include "asteroids/core/game_config.hpp"
#include "asteroids/core/game_controller.hpp"
#include "asteroids/core/profile.hpp"

namespace {

GameConstants::Difficulty parseDifficulty(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto difficulty : GameConstants::getAllDifficulties()) {
        if (GameConstants::getDifficultyName(difficulty) == name) {
            return difficulty;
        }
    }
    std::cerr << "Unknown difficulty '" << name << "', using NORMAL" << std::endl;
    return GameConstants::Difficulty::NORMAL;
}

void runLoop(GameController& controller, Renderer& renderer) {
    PROFILE_SCOPE("runLoop");

    InputNative input;
    sf::Clock frameClock;
    sf::Clock fpsClock;
    sf::Time accumulator = sf::Time::Zero;
    const sf::Time fixedTickDt = sf::seconds(1.f / GameConstants::StepsPerSecond);
    const int MAX_TICKS_PER_FRAME = 5;
    int frames = 0;
    float fps = 0.0f;

    while (controller.isRunning() && renderer.getWindow().isOpen()) {
        accumulator += frameClock.restart();

        InputIntents intents = input.poll(renderer.getWindow());
        bool const edgePending = intents.pause || intents.restart || intents.quit;

        int ticksThisFrame = 0;
        while (accumulator >= fixedTickDt && ticksThisFrame < MAX_TICKS_PER_FRAME) {
            controller.update(intents, fixedTickDt.asSeconds());
            // Edge intents apply to the first tick of the frame only
            intents.pause = intents.restart = intents.quit = false;
            accumulator -= fixedTickDt;
            ++ticksThisFrame;
        }
        if (ticksThisFrame == MAX_TICKS_PER_FRAME) {
            accumulator = sf::Time::Zero;
        }
        if (ticksThisFrame == 0 && edgePending) {
            controller.update(intents, 0.0);
        }

        {
            PROFILE_SCOPE("render");
            RenderSnapshot const snap = controller.snapshot();
            renderer.clear();
            renderer.renderEntities(snap);
            renderer.renderHud(snap);
            renderer.renderFPS(fps);
            renderer.present();
        }

        ++frames;
        if (fpsClock.getElapsedTime().asSeconds() >= 1.0f) {
            fps = static_cast<float>(frames) / fpsClock.restart().asSeconds();
            frames = 0;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    GameConstants::Difficulty difficulty = GameConstants::Difficulty::NORMAL;
    if (argc > 1) {
        difficulty = parseDifficulty(argv[1]);
    }

    GameConfig config = configForDifficulty(difficulty);
    config.seed = static_cast<std::uint32_t>(std::time(nullptr));

    try {
        GameController controller(config);

        Renderer renderer(static_cast<int>(config.screenWidth),
                          static_cast<int>(config.screenHeight));
        if (!renderer.init()) {
            std::cerr << "Renderer initialization failed." << std::endl;
            return 1;
        }

        std::cout << "Asteroids (" << GameConstants::getDifficultyName(difficulty) << ")" << std::endl;
        runLoop(controller, renderer);
        renderer.getWindow().close();
    } catch (const InvalidConfiguration& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Profiling::Profiler::printStats(std::cout);
    return 0;
}
