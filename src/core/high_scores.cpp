#include "asteroids/core/high_scores.hpp"

#include <algorithm>
#include <iterator>

HighScoreTable::HighScoreTable(std::size_t capacity)
    : maxEntries(capacity)
{
}

bool HighScoreTable::qualifies(int score) const {
    if (maxEntries == 0) {
        return false;
    }
    return table.size() < maxEntries || score > table.back().score;
}

int HighScoreTable::record(const std::string& name, int score, int wave) {
    if (!qualifies(score)) {
        return -1;
    }

    // upper_bound keeps equal scores in insertion order
    auto pos = std::upper_bound(table.begin(), table.end(), score,
        [](int value, const Entry& e) { return value > e.score; });
    auto inserted = table.insert(pos, Entry{name, score, wave});
    int const rank = static_cast<int>(std::distance(table.begin(), inserted));

    if (table.size() > maxEntries) {
        table.pop_back();
    }
    return rank;
}

int HighScoreTable::best() const {
    return table.empty() ? 0 : table.front().score;
}
