#ifndef ASTEROIDS_CONSTANTS_HPP
#define ASTEROIDS_CONSTANTS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace GameConstants {

    /**
     * @brief Difficulty presets for a new game.
     */
    enum class Difficulty {
        EASY,
        NORMAL,
        HARD
    };

    // Truly global constants
    extern const double Pi;

    // Display constants
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;

    // Longest step the core will integrate; longer frames are clamped
    extern const double MaxTickSeconds;

    // Score per asteroid tier
    extern const int ScoreLargeAsteroid;
    extern const int ScoreMediumAsteroid;
    extern const int ScoreSmallAsteroid;

    // Number of entries kept in the session high score table
    extern const std::size_t HighScoreCapacity;

    double degreesToRadians(double degrees);
    double radiansToDegrees(double radians);

    std::vector<Difficulty> getAllDifficulties();
    std::string getDifficultyName(Difficulty difficulty);
}

#endif // ASTEROIDS_CONSTANTS_HPP
