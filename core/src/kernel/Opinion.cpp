#include "kernel/Opinion.h"
#include <cctype>
#include <stdexcept>

namespace opinion {

const char* tieBreakName(TieBreak rule) {
    switch (rule) {
        case TieBreak::Negative: return "negative";
        case TieBreak::Positive: return "positive";
        case TieBreak::KeepCurrent: return "keep";
    }
    return "unknown";
}

bool parseTieBreak(const std::string& name, TieBreak& out) {
    if (name == "negative") { out = TieBreak::Negative; return true; }
    if (name == "positive") { out = TieBreak::Positive; return true; }
    if (name == "keep") { out = TieBreak::KeepCurrent; return true; }
    return false;
}

bool parseSeed(const std::string& text, std::uint64_t& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace opinion
