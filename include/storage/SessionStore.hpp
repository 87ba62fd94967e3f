#pragma once

#include <optional>
#include <string>

#include "core/GameSnapshot.hpp"

namespace handtris::storage {

/// Keeps one serialized GameSnapshot on disk so a session survives an
/// interruption (window closed or minimized).
class SessionStore {
public:
    explicit SessionStore(std::string path);

    bool save(const core::GameSnapshot& snapshot) const;

    /// std::nullopt if there is no session file or it does not parse.
    std::optional<core::GameSnapshot> load() const;

    /// Remove the session file. Returns false if there was nothing to remove.
    bool clear() const;

    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
};

} // namespace handtris::storage
