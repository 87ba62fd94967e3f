#pragma once

#include <string>
#include <optional>
#include "core/GameSnapshot.hpp"

namespace handtris::storage {

/// Serialize a GameSnapshot into a single line of text (without trailing '\n').
///
/// Layout, ';'-separated:
///   SNAPSHOT;rows;cols;cell,cell,...;score;highScore;over;paused;P;type;rot;x;y;next
/// or with 'N' and no piece fields when there is no current piece.
std::string serializeSnapshot(const core::GameSnapshot& snapshot);

/// Parse a snapshot line. Returns std::nullopt on any malformed field,
/// unknown piece ordinal or a cell count that does not match rows * cols.
/// Semantic checks against a live board are left to core::validateSnapshot.
std::optional<core::GameSnapshot> deserializeSnapshot(const std::string& line);

} // namespace handtris::storage
