#include "modules/FixedPoint.h"
#include "utils/Validation.h"
#include <algorithm>
#include <boost/math/distributions/binomial.hpp>
#include <boost/math/tools/roots.hpp>
#include <cmath>
#include <limits>
#include <sstream>

namespace {

void checkProbability(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be in [0,1] (got " +
                                    std::to_string(value) + ")");
    }
}

void checkPollSize(int m) {
    if (m <= 0) {
        throw std::invalid_argument("m must be > 0 (got " + std::to_string(m) + ")");
    }
}

std::string bracketMessage(double lo, double hi, double lower, double upper) {
    std::ostringstream os;
    os << "no sign change of F(q)-q on [" << lo << ", " << hi
       << "] (stable points " << lower << ", " << upper << ")";
    return os.str();
}

} // namespace

RootBracketError::RootBracketError(double bracketLow, double bracketHigh, double lower, double upper)
    : std::runtime_error(bracketMessage(bracketLow, bracketHigh, lower, upper)),
      bracket_low_(bracketLow), bracket_high_(bracketHigh), lower_(lower), upper_(upper) {}

double majorityProbability(double pi, int m) {
    checkProbability(pi, "pi");
    checkPollSize(m);

    // Upper tail P(X >= ceil(m/2)) of Binomial(m, pi); stable for large m
    const boost::math::binomial_distribution<double> poll(static_cast<double>(m), pi);
    const double threshold = static_cast<double>((m + 1) / 2);
    const double tail = boost::math::cdf(boost::math::complement(poll, threshold - 1.0));
    return std::min(std::max(tail, 0.0), 1.0);
}

double selfConsistencyMap(double q, double z, double p, int m) {
    checkProbability(q, "q");
    checkProbability(z, "z");
    checkProbability(p, "p");
    const double pi = z * p + (1.0 - z) * q;
    return majorityProbability(std::min(std::max(pi, 0.0), 1.0), m);
}

FixedPoints findFixedPoints(double z, double p, int m, const FixedPointConfig& cfg) {
    checkProbability(z, "z");
    checkProbability(p, "p");
    checkPollSize(m);
    if (cfg.iterations < 0) {
        throw std::invalid_argument("iterations must be >= 0");
    }

    FixedPoints fp;
    double q0 = 0.0;
    double q1 = 1.0;
    for (int k = 0; k < cfg.iterations; ++k) {
        q0 = selfConsistencyMap(q0, z, p, m);
        q1 = selfConsistencyMap(q1, z, p, m);
    }
    fp.lower = q0;
    fp.upper = q1;

    const double lo = q0 + cfg.bracketMargin;
    const double hi = q1 - cfg.bracketMargin;
    if (!(lo < hi)) {
        throw RootBracketError(lo, hi, q0, q1);
    }

    auto residual = [z, p, m](double q) { return selfConsistencyMap(q, z, p, m) - q; };
    // bisect() returns an endpoint whose residual is exactly zero
    if (residual(lo) * residual(hi) > 0.0) {
        throw RootBracketError(lo, hi, q0, q1);
    }

    std::uintmax_t maxIter = cfg.maxBisections;
    const auto root = boost::math::tools::bisect(
        residual, lo, hi, boost::math::tools::eps_tolerance<double>(cfg.toleranceBits), maxIter);
    fp.middle = 0.5 * (root.first + root.second);

    validation::checkUnitInterval(fp.middle, "findFixedPoints middle");
    return fp;
}

std::vector<FixedPointCurvePoint> fixedPointCurve(const std::vector<double>& zValues,
                                                  double p, int m,
                                                  const FixedPointConfig& cfg) {
    std::vector<FixedPointCurvePoint> curve;
    curve.reserve(zValues.size());

    for (double z : zValues) {
        FixedPointCurvePoint point;
        point.informedFraction = z;
        try {
            const FixedPoints fp = findFixedPoints(z, p, m, cfg);
            point.lower = fp.lower;
            point.upper = fp.upper;
            point.middle = fp.middle;
            point.hasMiddle = true;
        } catch (const RootBracketError& e) {
            // Monostable (or nearly so): only the stable points exist
            point.lower = e.lower();
            point.upper = e.upper();
            point.middle = std::numeric_limits<double>::quiet_NaN();
            point.hasMiddle = false;
        }
        curve.push_back(point);
    }
    return curve;
}
