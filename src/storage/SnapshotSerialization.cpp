#include "storage/SnapshotSerialization.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <vector>

namespace handtris::storage {

namespace {
    constexpr const char* Tag = "SNAPSHOT";

    std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out;
        std::string field;
        std::istringstream is(s);
        while (std::getline(is, field, sep)) {
            out.push_back(field);
        }
        // getline drops a trailing empty field
        if (!s.empty() && s.back() == sep) {
            out.emplace_back();
        }
        return out;
    }

    template <typename T>
    bool parseNumber(const std::string& s, T& out) {
        if (s.empty()) return false;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    }

    bool parseFlag(const std::string& s, bool& out) {
        if (s == "1") { out = true;  return true; }
        if (s == "0") { out = false; return true; }
        return false;
    }

    bool parsePieceType(const std::string& s, core::PieceType& out) {
        int ordinal = 0;
        return parseNumber(s, ordinal) && core::pieceTypeFromOrdinal(ordinal, out);
    }
}

std::string serializeSnapshot(const core::GameSnapshot& snapshot)
{
    std::ostringstream os;

    os << Tag << ';'
       << snapshot.rows << ';'
       << snapshot.cols << ';';

    for (std::size_t i = 0; i < snapshot.cells.size(); ++i) {
        if (i > 0) os << ',';
        os << snapshot.cells[i];
    }

    os << ';' << snapshot.score
       << ';' << snapshot.highScore
       << ';' << (snapshot.isGameOver ? 1 : 0)
       << ';' << (snapshot.isPaused ? 1 : 0);

    if (snapshot.currentPiece) {
        const auto& p = *snapshot.currentPiece;
        os << ";P;"
           << core::ordinalOf(p.type) << ';'
           << p.rotation << ';'
           << p.x << ';'
           << p.y;
    } else {
        os << ";N";
    }

    os << ';' << core::ordinalOf(snapshot.nextPieceType);

    return os.str();
}

std::optional<core::GameSnapshot> deserializeSnapshot(const std::string& line)
{
    const auto fields = split(line, ';');

    // Tag, rows, cols, cells, score, high, over, paused, P/N, [4 piece fields], next
    if (fields.size() != 10 && fields.size() != 14) {
        return std::nullopt;
    }
    if (fields[0] != Tag) {
        return std::nullopt;
    }

    core::GameSnapshot s;

    if (!parseNumber(fields[1], s.rows) || !parseNumber(fields[2], s.cols)) return std::nullopt;
    if (s.rows <= 0 || s.cols <= 0) return std::nullopt;

    const auto expected = static_cast<std::size_t>(s.rows) * static_cast<std::size_t>(s.cols);
    const auto cellFields = split(fields[3], ',');
    if (cellFields.size() != expected) {
        return std::nullopt;
    }
    s.cells.reserve(expected);
    for (const auto& f : cellFields) {
        core::Color c = 0;
        if (!parseNumber(f, c)) return std::nullopt;
        s.cells.push_back(c);
    }

    if (!parseNumber(fields[4], s.score)) return std::nullopt;
    if (!parseNumber(fields[5], s.highScore)) return std::nullopt;
    if (!parseFlag(fields[6], s.isGameOver)) return std::nullopt;
    if (!parseFlag(fields[7], s.isPaused)) return std::nullopt;

    std::size_t next = 9;
    if (fields[8] == "P") {
        if (fields.size() != 14) return std::nullopt;

        core::CurrentPieceSnapshot p;
        if (!parsePieceType(fields[9], p.type)) return std::nullopt;
        if (!parseNumber(fields[10], p.rotation)) return std::nullopt;
        if (!parseNumber(fields[11], p.x)) return std::nullopt;
        if (!parseNumber(fields[12], p.y)) return std::nullopt;
        s.currentPiece = p;
        next = 13;
    } else if (fields[8] == "N") {
        if (fields.size() != 10) return std::nullopt;
    } else {
        return std::nullopt;
    }

    if (!parsePieceType(fields[next], s.nextPieceType)) return std::nullopt;

    return s;
}

} // namespace handtris::storage
