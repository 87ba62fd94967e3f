#include "storage/HighScoreStore.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace handtris::storage {

HighScoreStore::HighScoreStore(std::string path)
    : m_path(std::move(path))
{
}

std::uint64_t HighScoreStore::load() const
{
    std::ifstream in(m_path);
    if (!in) {
        // First run: nothing stored yet
        return 0;
    }

    std::uint64_t value = 0;
    if (!(in >> value)) {
        std::cerr << "[storage] ignoring unreadable high score file " << m_path << "\n";
        return 0;
    }
    return value;
}

bool HighScoreStore::save(std::uint64_t highScore) const
{
    std::ofstream out(m_path, std::ios::trunc);
    if (!out) {
        std::cerr << "[storage] cannot open " << m_path << " for writing\n";
        return false;
    }

    out << highScore << '\n';
    if (!out) {
        std::cerr << "[storage] failed to write high score to " << m_path << "\n";
        return false;
    }
    return true;
}

} // namespace handtris::storage
