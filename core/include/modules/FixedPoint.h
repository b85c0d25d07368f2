#ifndef FIXED_POINT_H
#define FIXED_POINT_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Mean-field fixed points of the informed/follower model.
 *
 * A follower polling m agents sees a +1 with probability
 *   pi = z*p + (1-z)*q
 * where q is the follower accuracy. The self-consistency map
 *   F_z(q) = P(at least ceil(m/2) of m Bernoulli(pi) draws are +1)
 * has stable fixed points reached by iterating from q=0 and q=1, and
 * (when bistable) an unstable one between them.
 */

struct FixedPointConfig {
    int iterations = 200;          // iterations from each boundary
    double bracketMargin = 0.1;    // root search on [lower+margin, upper-margin]
    int toleranceBits = 40;        // bisection accuracy
    std::uintmax_t maxBisections = 200;
};

struct FixedPoints {
    double lower = 0.0;   // stable, reached from q=0
    double upper = 1.0;   // stable, reached from q=1
    double middle = 0.5;  // unstable
};

// Raised when the middle-root bracket holds no sign change
class RootBracketError : public std::runtime_error {
public:
    RootBracketError(double bracketLow, double bracketHigh, double lower, double upper);

    double bracketLow() const { return bracket_low_; }
    double bracketHigh() const { return bracket_high_; }
    double lower() const { return lower_; }
    double upper() const { return upper_; }

private:
    double bracket_low_;
    double bracket_high_;
    double lower_;
    double upper_;
};

// P(at least ceil(m/2) successes in m Bernoulli(pi) trials)
double majorityProbability(double pi, int m);

// F_z(q)
double selfConsistencyMap(double q, double z, double p, int m);

// Throws std::invalid_argument on bad parameters, RootBracketError when
// the middle fixed point cannot be bracketed.
FixedPoints findFixedPoints(double z, double p, int m,
                            const FixedPointConfig& cfg = FixedPointConfig());

// ---------- Curves over z ----------
struct FixedPointCurvePoint {
    double informedFraction = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    double middle = 0.0;   // NaN when hasMiddle is false
    bool hasMiddle = false;
};

std::vector<FixedPointCurvePoint> fixedPointCurve(const std::vector<double>& zValues,
                                                  double p, int m,
                                                  const FixedPointConfig& cfg = FixedPointConfig());

#endif // FIXED_POINT_H
