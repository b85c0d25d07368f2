#include "modules/Hysteresis.h"
#include "kernel/RandomFieldIsing.h"
#include <stdexcept>
#include <string>

std::vector<double> makeFieldRamp(double from, double to, std::size_t steps) {
    std::vector<double> fields;
    if (steps == 0) return fields;
    if (steps == 1) {
        fields.push_back(from);
        return fields;
    }
    fields.reserve(steps);
    const double delta = (to - from) / static_cast<double>(steps - 1);
    for (std::size_t k = 0; k < steps; ++k) {
        fields.push_back(from + delta * static_cast<double>(k));
    }
    fields.back() = to;
    return fields;
}

std::vector<double> makeHysteresisFields(double maxField, std::size_t stepsPerBranch) {
    if (maxField < 0.0) {
        throw std::invalid_argument("maxField must be >= 0 (got " + std::to_string(maxField) + ")");
    }
    std::vector<double> fields = makeFieldRamp(-maxField, maxField, stepsPerBranch);
    const std::vector<double> down = makeFieldRamp(maxField, -maxField, stepsPerBranch);
    if (!down.empty()) {
        fields.insert(fields.end(), down.begin() + 1, down.end());
    }
    return fields;
}

std::vector<HysteresisPoint> hysteresisLoop(RandomFieldIsing& model,
                                            const std::vector<double>& fields) {
    std::vector<HysteresisPoint> loop;
    loop.reserve(fields.size());

    for (double f : fields) {
        model.setField(f);
        const RelaxResult r = model.relax();

        HysteresisPoint point;
        point.field = f;
        point.meanOpinion = model.meanOpinion();
        point.flips = r.flips;
        point.sweeps = r.sweeps;
        point.converged = r.converged;
        loop.push_back(point);
    }
    return loop;
}

std::vector<std::uint64_t> sampleAvalanches(RandomFieldIsing& model, double dF, std::size_t count) {
    auto settle = [&model](const char* when) {
        const RelaxResult r = model.relax();
        if (!r.converged) {
            throw std::runtime_error(std::string("no equilibrium ") + when + " (field=" +
                                     std::to_string(model.field()) + ", sweeps=" +
                                     std::to_string(r.sweeps) + ")");
        }
    };

    settle("before sampling");

    std::vector<std::uint64_t> sizes;
    sizes.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        sizes.push_back(model.perturb(dF));
        settle("after perturbation");
    }
    return sizes;
}

std::map<std::uint64_t, std::uint64_t> avalancheHistogram(const std::vector<std::uint64_t>& sizes) {
    std::map<std::uint64_t, std::uint64_t> histogram;
    for (auto s : sizes) {
        ++histogram[s];
    }
    return histogram;
}
