#include "asteroids/core/constants.hpp"

namespace GameConstants {

    const double Pi      = 3.14159265358979323846;

    // Display
    const unsigned int ScreenWidth    = 800;
    const unsigned int ScreenHeight   = 600;
    const unsigned int StepsPerSecond = 60;

    const double MaxTickSeconds = 0.05;

    const int ScoreLargeAsteroid  = 20;
    const int ScoreMediumAsteroid = 50;
    const int ScoreSmallAsteroid  = 100;

    const std::size_t HighScoreCapacity = 10;

    double degreesToRadians(double degrees) {
        return degrees * Pi / 180.0;
    }

    double radiansToDegrees(double radians) {
        return radians * 180.0 / Pi;
    }

    std::vector<Difficulty> getAllDifficulties() {
        return {
            Difficulty::EASY,
            Difficulty::NORMAL,
            Difficulty::HARD
        };
    }

    std::string getDifficultyName(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::EASY:   return "EASY";
            case Difficulty::NORMAL: return "NORMAL";
            case Difficulty::HARD:   return "HARD";
            default: return "UNKNOWN";
        }
    }

} // namespace GameConstants
