#ifndef RANDOM_FIELD_ISING_H
#define RANDOM_FIELD_ISING_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include "kernel/Opinion.h"
#include "utils/EventLog.h"

// ---------- Configuration ----------
struct IsingConfig {
    double coupling = 1.0;               // J
    double field = 0.0;                  // F (initial external field)
    std::uint32_t population = 500;      // N
    double disorder = 1.2;               // delta, Laplace scale of the biases
    std::uint64_t maxRelaxSweeps = 10000;
    std::uint64_t seed = 42;
};

struct RelaxResult {
    std::uint64_t sweeps = 0;   // sweeps performed, including the final quiet one
    std::uint64_t flips = 0;    // total flips across all sweeps
    bool converged = false;     // last sweep produced zero flips
};

/**
 * Random-Field Ising opinion model with mean-field coupling.
 *
 * Agent i prefers sign(h_i + F + J * m_i), where m_i is the mean opinion of
 * everybody except i. Biases h are drawn once from Laplace(0, delta).
 * A local field of exactly zero never triggers a flip.
 */
class RandomFieldIsing {
public:
    explicit RandomFieldIsing(const IsingConfig& cfg);

    void reset(const IsingConfig& cfg);

    double localField(std::size_t i) const;
    double meanOpinion() const;

    // Flips agent i if its opinion disagrees with its local field
    bool tryFlip(std::size_t i);

    // One in-place pass over 0..N-1; returns the number of flips
    std::uint64_t sweep();

    // Sweeps until a pass is quiet or maxRelaxSweeps is reached
    RelaxResult relax();

    // Shifts F by dF and runs a single sweep; the flip count is the avalanche size
    std::uint64_t perturb(double dF);

    void setField(double field) { cfg_.field = field; }
    double field() const { return cfg_.field; }
    double coupling() const { return cfg_.coupling; }
    double disorder() const { return cfg_.disorder; }

    // Access
    const IsingConfig& config() const { return cfg_; }
    const std::vector<Opinion>& opinions() const { return opinions_; }
    const std::vector<double>& biases() const { return biases_; }
    std::uint64_t generation() const { return generation_; }
    std::size_t size() const { return opinions_.size(); }

    // Event log access
    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

    static void validate(const IsingConfig& cfg);

private:
    void initState();

    IsingConfig cfg_;
    std::vector<Opinion> opinions_;
    std::vector<double> biases_;   // fixed after construction/reset
    long long opinion_sum_ = 0;    // running sum of opinions_
    std::uint64_t generation_ = 0; // sweeps performed
    std::mt19937_64 rng_;
    EventLog event_log_;
};

#endif // RANDOM_FIELD_ISING_H
