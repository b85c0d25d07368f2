#include "kernel/RandomFieldIsing.h"
#include "utils/Validation.h"
#include <boost/math/distributions/laplace.hpp>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

RandomFieldIsing::RandomFieldIsing(const IsingConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

void RandomFieldIsing::validate(const IsingConfig& cfg) {
    if (cfg.population == 0 || cfg.population > kMaxPopulation) {
        throw std::invalid_argument("population must be in [1, " + std::to_string(kMaxPopulation) +
                                    "] (got " + std::to_string(cfg.population) + ")");
    }
    if (!(cfg.disorder > 0.0) || !std::isfinite(cfg.disorder)) {
        throw std::invalid_argument("disorder must be a finite value > 0 (got " +
                                    std::to_string(cfg.disorder) + ")");
    }
    if (!std::isfinite(cfg.coupling) || !std::isfinite(cfg.field)) {
        throw std::invalid_argument("coupling and field must be finite");
    }
    if (cfg.maxRelaxSweeps == 0) {
        throw std::invalid_argument("maxRelaxSweeps must be > 0");
    }
}

void RandomFieldIsing::reset(const IsingConfig& cfg) {
    validate(cfg);
    cfg_ = cfg;
    generation_ = 0;
    rng_.seed(cfg.seed);
    event_log_.clear();
    initState();
}

void RandomFieldIsing::initState() {
    const std::size_t n = cfg_.population;
    opinions_.resize(n);
    biases_.resize(n);

    std::bernoulli_distribution fairDist(0.5);
    for (auto& s : opinions_) {
        s = fairDist(rng_) ? kPositive : kNegative;
    }

    // Inverse transform on the open interval (0,1); quantile(0) is -inf
    const boost::math::laplace_distribution<double> laplace(0.0, cfg_.disorder);
    std::uniform_real_distribution<double> uniDist(std::numeric_limits<double>::min(), 1.0);
    for (auto& h : biases_) {
        h = boost::math::quantile(laplace, uniDist(rng_));
    }

    opinion_sum_ = std::accumulate(opinions_.begin(), opinions_.end(), 0LL);
    validation::checkOpinions(opinions_, "RandomFieldIsing::initState");
}

double RandomFieldIsing::localField(std::size_t i) const {
    if (opinions_.size() <= 1) {
        throw std::invalid_argument("localField requires population > 1 (got " +
                                    std::to_string(opinions_.size()) + ")");
    }
    if (i >= opinions_.size()) {
        throw std::out_of_range("agent index " + std::to_string(i) + " >= " +
                                std::to_string(opinions_.size()));
    }
    const double localMean = static_cast<double>(opinion_sum_ - opinions_[i]) /
                             static_cast<double>(opinions_.size() - 1);
    return biases_[i] + cfg_.field + cfg_.coupling * localMean;
}

double RandomFieldIsing::meanOpinion() const {
    return static_cast<double>(opinion_sum_) / static_cast<double>(opinions_.size());
}

bool RandomFieldIsing::tryFlip(std::size_t i) {
    const int preferred = opinion::sign(localField(i));
    if (opinions_[i] * preferred != -1) {
        return false;
    }
    opinions_[i] = static_cast<Opinion>(-opinions_[i]);
    opinion_sum_ += 2 * opinions_[i];
    return true;
}

std::uint64_t RandomFieldIsing::sweep() {
    std::uint64_t flips = 0;
    for (std::size_t i = 0; i < opinions_.size(); ++i) {
        if (tryFlip(i)) ++flips;
    }
    ++generation_;
    validation::checkOpinions(opinions_, "RandomFieldIsing::sweep");
    return flips;
}

RelaxResult RandomFieldIsing::relax() {
    RelaxResult result;
    while (result.sweeps < cfg_.maxRelaxSweeps) {
        const std::uint64_t flips = sweep();
        ++result.sweeps;
        result.flips += flips;
        if (flips == 0) {
            result.converged = true;
            break;
        }
    }

    if (result.flips > 0) {
        event_log_.logRelaxation(generation_, cfg_.field, result.flips);
    }
    if (!result.converged) {
        event_log_.logNonConvergence(generation_, cfg_.field, result.sweeps);
    }
    return result;
}

std::uint64_t RandomFieldIsing::perturb(double dF) {
    if (!std::isfinite(dF)) {
        throw std::invalid_argument("field step must be finite (got " + std::to_string(dF) + ")");
    }
    cfg_.field += dF;
    const std::uint64_t flips = sweep();
    event_log_.logAvalanche(generation_, cfg_.field, flips);
    return flips;
}
