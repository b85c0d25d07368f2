#ifndef HYSTERESIS_H
#define HYSTERESIS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

class RandomFieldIsing;

struct HysteresisPoint {
    double field = 0.0;
    double meanOpinion = 0.0;   // after relaxation at this field
    std::uint64_t flips = 0;
    std::uint64_t sweeps = 0;
    bool converged = true;
};

// `steps` evenly spaced values from `from` to `to` inclusive
std::vector<double> makeFieldRamp(double from, double to, std::size_t steps);

// -maxField -> +maxField -> -maxField, turning point not repeated
std::vector<double> makeHysteresisFields(double maxField, std::size_t stepsPerBranch);

// Sets each field in turn and relaxes; opinion state carries over
std::vector<HysteresisPoint> hysteresisLoop(RandomFieldIsing& model,
                                            const std::vector<double>& fields);

// Relaxes, then `count` times: raise F by dF, record the flips of a single
// sweep (the avalanche size), relax back to equilibrium.
// Throws std::runtime_error if the model fails to reach equilibrium.
std::vector<std::uint64_t> sampleAvalanches(RandomFieldIsing& model, double dF, std::size_t count);

// size -> occurrences
std::map<std::uint64_t, std::uint64_t> avalancheHistogram(const std::vector<std::uint64_t>& sizes);

#endif // HYSTERESIS_H
