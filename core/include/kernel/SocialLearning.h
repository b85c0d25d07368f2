#ifndef SOCIAL_LEARNING_H
#define SOCIAL_LEARNING_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include "kernel/Opinion.h"

// ---------- Configuration ----------
struct SocialLearningConfig {
    std::uint32_t population = 300;     // N
    double informedFraction = 0.3;      // z, informed count = floor(z*N)
    double informedAccuracy = 0.52;     // p = P(informed opinion is +1)
    std::uint32_t pollSize = 12;        // m, sampled with replacement
    TieBreak tieBreak = TieBreak::Negative;  // poll mean of exactly zero
    std::uint64_t seed = 42;
};

/**
 * Informed/follower social-learning model.
 *
 * Indices [0, informed) hold informed agents whose opinions are drawn once
 * with P(+1) = p and never updated. Indices [informed, N) are followers.
 * Each step picks one follower uniformly at random, polls m agents uniformly
 * with replacement (the follower itself included), and sets the follower to
 * the sign of the poll mean. +1 is the "correct" opinion, so accuracy is the
 * fraction of +1 entries.
 */
class SocialLearning {
public:
    explicit SocialLearning(const SocialLearningConfig& cfg);

    // Lifecycle
    void reset(const SocialLearningConfig& cfg);
    void step();
    void stepN(int n);

    // Deterministic core of step(): sets `follower` to the resolved sign of
    // the mean opinion over `poll` and returns the new opinion.
    Opinion applyPoll(std::size_t follower, const std::vector<std::size_t>& poll);

    // Accuracy traces recorded before each step
    struct Trace {
        std::vector<double> followerAccuracy;
        std::vector<double> overallAccuracy;
    };
    Trace run(std::size_t steps);

    // Statistics (fraction of +1 entries; 0 for an empty group)
    double computeFollowerAccuracy() const;
    double computeOverallAccuracy() const;
    double computeInformedAccuracy() const;

    // Access
    const SocialLearningConfig& config() const { return cfg_; }
    const std::vector<Opinion>& opinions() const { return opinions_; }
    std::size_t informedCount() const { return informed_; }
    std::size_t followerCount() const { return opinions_.size() - informed_; }
    std::uint64_t generation() const { return generation_; }

    static void validate(const SocialLearningConfig& cfg);
    static std::size_t informedCountFor(std::uint32_t population, double informedFraction);

private:
    void initOpinions();
    double fractionPositive(std::size_t begin, std::size_t end) const;

    SocialLearningConfig cfg_;
    std::vector<Opinion> opinions_;
    std::size_t informed_ = 0;
    std::uint64_t generation_ = 0;
    std::mt19937_64 rng_;
};

// ---------- Long-run accuracy ----------

// Mean of the last `fraction` of `trace` (at least one entry). Empty trace -> 0.
double tailMean(const std::vector<double>& trace, double fraction);

struct AccuracyPoint {
    double informedFraction = 0.0;  // z
    double followerAccuracy = 0.0;  // long-run q
};

// Runs a fresh model per z (seed = base.seed + index) for `steps` steps and
// reports the tail mean of follower accuracy.
std::vector<AccuracyPoint> sweepInformedFraction(const SocialLearningConfig& base,
                                                 const std::vector<double>& zValues,
                                                 std::size_t steps,
                                                 double tailFraction = 0.5);

#endif // SOCIAL_LEARNING_H
