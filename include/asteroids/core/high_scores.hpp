#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "asteroids/core/constants.hpp"

/**
 * @class HighScoreTable
 * @brief Best scores of the current process, highest first.
 *
 * Kept in memory only. Equal scores keep their insertion order, so an
 * earlier entry stays ahead of a later one with the same score.
 */
class HighScoreTable {
public:
    struct Entry {
        std::string name;
        int score = 0;
        int wave = 0;
    };

    explicit HighScoreTable(std::size_t capacity = GameConstants::HighScoreCapacity);

    /**
     * @brief True if the score would enter the table.
     */
    bool qualifies(int score) const;

    /**
     * @brief Inserts a score if it qualifies.
     * @return Zero-based rank of the new entry, or -1 if it did not make the table
     */
    int record(const std::string& name, int score, int wave);

    /** @brief Highest score so far, 0 when empty */
    int best() const;

    const std::vector<Entry>& entries() const { return table; }
    std::size_t capacity() const { return maxEntries; }

private:
    std::size_t maxEntries;
    std::vector<Entry> table;
};
