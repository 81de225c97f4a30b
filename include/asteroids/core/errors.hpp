#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Thrown when a GameConfig cannot produce a playable session.
 *
 * Raised only at session creation; nothing inside a tick throws.
 */
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::runtime_error("Invalid configuration: " + what) {}
};
