#pragma once

#include <cstdint>
#include <string>

namespace handtris::storage {

/// Persists the single high-score integer in a small text file.
class HighScoreStore {
public:
    explicit HighScoreStore(std::string path);

    /// Stored value, or 0 if the file is missing or unreadable.
    std::uint64_t load() const;

    /// Returns false if the file could not be written.
    bool save(std::uint64_t highScore) const;

    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
};

} // namespace handtris::storage
