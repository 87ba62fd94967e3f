#include "storage/SessionStore.hpp"
#include "storage/SnapshotSerialization.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <utility>

namespace handtris::storage {

SessionStore::SessionStore(std::string path)
    : m_path(std::move(path))
{
}

bool SessionStore::save(const core::GameSnapshot& snapshot) const
{
    std::ofstream out(m_path, std::ios::trunc);
    if (!out) {
        std::cerr << "[storage] cannot open " << m_path << " for writing\n";
        return false;
    }

    out << serializeSnapshot(snapshot) << '\n';
    if (!out) {
        std::cerr << "[storage] failed to write session to " << m_path << "\n";
        return false;
    }
    return true;
}

std::optional<core::GameSnapshot> SessionStore::load() const
{
    std::ifstream in(m_path);
    if (!in) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(in, line)) {
        std::cerr << "[storage] empty session file " << m_path << "\n";
        return std::nullopt;
    }

    auto snapshot = deserializeSnapshot(line);
    if (!snapshot) {
        std::cerr << "[storage] malformed session file " << m_path << "\n";
    }
    return snapshot;
}

bool SessionStore::clear() const
{
    return std::remove(m_path.c_str()) == 0;
}

} // namespace handtris::storage
