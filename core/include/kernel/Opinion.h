#ifndef OPINION_H
#define OPINION_H

#include <cstdint>
#include <string>

// Binary opinion: exactly +1 or -1
using Opinion = std::int8_t;

constexpr Opinion kPositive = 1;
constexpr Opinion kNegative = -1;

// Upper bound on agents per model; guards against wrapped unsigned input
constexpr std::uint32_t kMaxPopulation = 10000000;

// Resolution of a signed quantity that is exactly zero
enum class TieBreak : std::uint8_t {
    Negative = 0,     // zero resolves to -1
    Positive = 1,     // zero resolves to +1
    KeepCurrent = 2   // zero leaves the current opinion untouched
};

namespace opinion {

inline int sign(double value) {
    return (value > 0.0) - (value < 0.0);
}

// Maps a signed value to an opinion, applying `rule` when value == 0.0
inline Opinion resolveSign(double value, Opinion current, TieBreak rule) {
    if (value > 0.0) return kPositive;
    if (value < 0.0) return kNegative;
    switch (rule) {
        case TieBreak::Positive: return kPositive;
        case TieBreak::KeepCurrent: return current;
        case TieBreak::Negative:
        default: return kNegative;
    }
}

const char* tieBreakName(TieBreak rule);
bool parseTieBreak(const std::string& name, TieBreak& out);

// Decimal digits only; leaves `out` untouched and returns false otherwise
bool parseSeed(const std::string& text, std::uint64_t& out);

} // namespace opinion

#endif // OPINION_H
