#include "kernel/SocialLearning.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

SocialLearning::SocialLearning(const SocialLearningConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

void SocialLearning::validate(const SocialLearningConfig& cfg) {
    if (cfg.population == 0 || cfg.population > kMaxPopulation) {
        throw std::invalid_argument("population must be in [1, " + std::to_string(kMaxPopulation) +
                                    "] (got " + std::to_string(cfg.population) + ")");
    }
    if (!(cfg.informedFraction >= 0.0 && cfg.informedFraction <= 1.0)) {
        throw std::invalid_argument("informedFraction must be in [0,1] (got " +
                                    std::to_string(cfg.informedFraction) + ")");
    }
    if (!(cfg.informedAccuracy > 0.0 && cfg.informedAccuracy < 1.0)) {
        throw std::invalid_argument("informedAccuracy must be in (0,1) (got " +
                                    std::to_string(cfg.informedAccuracy) + ")");
    }
    if (cfg.pollSize == 0) {
        throw std::invalid_argument("pollSize must be > 0");
    }
}

std::size_t SocialLearning::informedCountFor(std::uint32_t population, double informedFraction) {
    const double raw = std::floor(informedFraction * static_cast<double>(population));
    if (raw < 0.0 || raw > static_cast<double>(population)) {
        throw std::invalid_argument("informed count " + std::to_string(raw) +
                                    " outside [0, " + std::to_string(population) + "]");
    }
    return static_cast<std::size_t>(raw);
}

void SocialLearning::reset(const SocialLearningConfig& cfg) {
    validate(cfg);
    cfg_ = cfg;
    generation_ = 0;
    rng_.seed(cfg.seed);
    informed_ = informedCountFor(cfg_.population, cfg_.informedFraction);
    initOpinions();
}

void SocialLearning::initOpinions() {
    opinions_.assign(cfg_.population, kNegative);

    std::bernoulli_distribution informedDist(cfg_.informedAccuracy);
    std::bernoulli_distribution fairDist(0.5);

    for (std::size_t i = 0; i < informed_; ++i) {
        opinions_[i] = informedDist(rng_) ? kPositive : kNegative;
    }
    for (std::size_t i = informed_; i < opinions_.size(); ++i) {
        opinions_[i] = fairDist(rng_) ? kPositive : kNegative;
    }

    validation::checkOpinions(opinions_, "SocialLearning::initOpinions");
}

void SocialLearning::step() {
    if (followerCount() == 0) {
        throw std::logic_error("step() requires at least one follower (informedFraction=" +
                               std::to_string(cfg_.informedFraction) + ")");
    }

    std::uniform_int_distribution<std::size_t> followerDist(informed_, opinions_.size() - 1);
    std::uniform_int_distribution<std::size_t> agentDist(0, opinions_.size() - 1);

    const std::size_t follower = followerDist(rng_);
    validation::checkIndex(follower, opinions_.size(), "SocialLearning::step follower");
    std::vector<std::size_t> poll(cfg_.pollSize);
    for (auto& idx : poll) {
        idx = agentDist(rng_);
    }

    applyPoll(follower, poll);
}

void SocialLearning::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

Opinion SocialLearning::applyPoll(std::size_t follower, const std::vector<std::size_t>& poll) {
    if (follower < informed_ || follower >= opinions_.size()) {
        throw std::out_of_range("follower index " + std::to_string(follower) +
                                " outside [" + std::to_string(informed_) + ", " +
                                std::to_string(opinions_.size()) + ")");
    }
    if (poll.empty()) {
        throw std::invalid_argument("poll group must not be empty");
    }

    long long sum = 0;
    for (std::size_t idx : poll) {
        if (idx >= opinions_.size()) {
            throw std::out_of_range("poll index " + std::to_string(idx) + " >= " +
                                    std::to_string(opinions_.size()));
        }
        sum += opinions_[idx];
    }
    const double mean = static_cast<double>(sum) / static_cast<double>(poll.size());

    Opinion& target = opinions_[follower];
    target = opinion::resolveSign(mean, target, cfg_.tieBreak);
    ++generation_;
    return target;
}

SocialLearning::Trace SocialLearning::run(std::size_t steps) {
    Trace trace;
    trace.followerAccuracy.reserve(steps);
    trace.overallAccuracy.reserve(steps);

    for (std::size_t t = 0; t < steps; ++t) {
        trace.followerAccuracy.push_back(computeFollowerAccuracy());
        trace.overallAccuracy.push_back(computeOverallAccuracy());
        step();
    }
    return trace;
}

double SocialLearning::fractionPositive(std::size_t begin, std::size_t end) const {
    if (end <= begin) return 0.0;
    const auto positives = std::count(opinions_.begin() + begin, opinions_.begin() + end, kPositive);
    return static_cast<double>(positives) / static_cast<double>(end - begin);
}

double SocialLearning::computeFollowerAccuracy() const {
    return fractionPositive(informed_, opinions_.size());
}

double SocialLearning::computeOverallAccuracy() const {
    return fractionPositive(0, opinions_.size());
}

double SocialLearning::computeInformedAccuracy() const {
    return fractionPositive(0, informed_);
}

double tailMean(const std::vector<double>& trace, double fraction) {
    if (trace.empty()) return 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);
    std::size_t count = static_cast<std::size_t>(std::ceil(fraction * trace.size()));
    count = std::clamp<std::size_t>(count, 1, trace.size());

    double sum = 0.0;
    for (std::size_t i = trace.size() - count; i < trace.size(); ++i) {
        sum += trace[i];
    }
    return sum / static_cast<double>(count);
}

std::vector<AccuracyPoint> sweepInformedFraction(const SocialLearningConfig& base,
                                                 const std::vector<double>& zValues,
                                                 std::size_t steps,
                                                 double tailFraction) {
    std::vector<AccuracyPoint> points;
    points.reserve(zValues.size());

    for (std::size_t k = 0; k < zValues.size(); ++k) {
        SocialLearningConfig cfg = base;
        cfg.informedFraction = zValues[k];
        cfg.seed = base.seed + k;

        SocialLearning model(cfg);
        AccuracyPoint point;
        point.informedFraction = zValues[k];
        if (model.followerCount() == 0) {
            // No followers to learn: report the informed accuracy instead
            point.followerAccuracy = model.computeInformedAccuracy();
        } else {
            auto trace = model.run(steps);
            point.followerAccuracy = steps > 0 ? tailMean(trace.followerAccuracy, tailFraction)
                                               : model.computeFollowerAccuracy();
        }
        points.push_back(point);
    }
    return points;
}
