#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "kernel/Opinion.h"

// Invariant checks for debug builds. Release builds (NDEBUG) compile them out.
namespace validation {

#ifndef NDEBUG

inline void checkOpinions(const std::vector<Opinion>& opinions, const char* context) {
    for (std::size_t i = 0; i < opinions.size(); ++i) {
        if (opinions[i] != kPositive && opinions[i] != kNegative) {
            throw std::logic_error(std::string(context) + ": opinion at index " +
                                   std::to_string(i) + " is " +
                                   std::to_string(static_cast<int>(opinions[i])));
        }
    }
}

inline void checkUnitInterval(double value, const char* context) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::logic_error(std::string(context) + ": " + std::to_string(value) +
                               " outside [0,1]");
    }
}

inline void checkIndex(std::size_t index, std::size_t size, const char* context) {
    if (index >= size) {
        throw std::logic_error(std::string(context) + ": index " + std::to_string(index) +
                               " >= " + std::to_string(size));
    }
}

#else

inline void checkOpinions(const std::vector<Opinion>&, const char*) {}
inline void checkUnitInterval(double, const char*) {}
inline void checkIndex(std::size_t, std::size_t, const char*) {}

#endif

} // namespace validation

#endif // VALIDATION_H
