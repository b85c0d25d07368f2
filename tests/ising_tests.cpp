#include <gtest/gtest.h>
#include "kernel/RandomFieldIsing.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace {

IsingConfig baseConfig() {
    IsingConfig cfg;
    cfg.coupling = 1.0;
    cfg.field = 0.0;
    cfg.population = 500;
    cfg.disorder = 1.2;
    cfg.seed = 7;
    return cfg;
}

bool allBinary(const std::vector<Opinion>& s) {
    return std::all_of(s.begin(), s.end(), [](Opinion o) { return o == 1 || o == -1; });
}

} // namespace

TEST(RandomFieldIsingTest, Initialization) {
    RandomFieldIsing model(baseConfig());

    EXPECT_EQ(model.size(), 500u);
    EXPECT_EQ(model.biases().size(), 500u);
    EXPECT_EQ(model.generation(), 0u);
    EXPECT_TRUE(allBinary(model.opinions()));
    EXPECT_GE(model.meanOpinion(), -1.0);
    EXPECT_LE(model.meanOpinion(), 1.0);
}

TEST(RandomFieldIsingTest, DeterministicInitialization) {
    RandomFieldIsing a(baseConfig());
    RandomFieldIsing b(baseConfig());

    EXPECT_EQ(a.opinions(), b.opinions());
    EXPECT_EQ(a.biases(), b.biases());
}

// Laplace(0, delta): mean 0, mean absolute deviation delta
TEST(RandomFieldIsingTest, BiasesFollowLaplace) {
    auto cfg = baseConfig();
    cfg.population = 20000;
    RandomFieldIsing model(cfg);

    const auto& h = model.biases();
    const double mean = std::accumulate(h.begin(), h.end(), 0.0) / h.size();
    double absSum = 0.0;
    for (double v : h) absSum += std::fabs(v);

    EXPECT_NEAR(mean, 0.0, 0.05);
    EXPECT_NEAR(absSum / h.size(), cfg.disorder, 0.05);
}

TEST(RandomFieldIsingTest, LocalFieldExcludesSelf) {
    RandomFieldIsing model(baseConfig());
    const auto& s = model.opinions();
    const double total = std::accumulate(s.begin(), s.end(), 0.0);

    for (std::size_t i : {std::size_t{0}, std::size_t{17}, std::size_t{499}}) {
        const double localMean = (total - s[i]) / (s.size() - 1.0);
        const double expected = model.biases()[i] + model.field() + model.coupling() * localMean;
        EXPECT_NEAR(model.localField(i), expected, 1e-12);
    }
}

TEST(RandomFieldIsingTest, LocalFieldRequiresTwoAgents) {
    auto cfg = baseConfig();
    cfg.population = 1;
    RandomFieldIsing model(cfg);

    EXPECT_THROW(model.localField(0), std::invalid_argument);
    EXPECT_THROW(model.sweep(), std::invalid_argument);
}

TEST(RandomFieldIsingTest, IndexOutOfRange) {
    RandomFieldIsing model(baseConfig());
    EXPECT_THROW(model.localField(500), std::out_of_range);
    EXPECT_THROW(model.tryFlip(500), std::out_of_range);
}

// Each index is attempted once per sweep, so flips == changed entries
TEST(RandomFieldIsingTest, SweepCountsFlips) {
    RandomFieldIsing model(baseConfig());
    const auto before = model.opinions();

    const std::uint64_t flips = model.sweep();

    std::uint64_t changed = 0;
    for (std::size_t i = 0; i < before.size(); ++i) {
        if (before[i] != model.opinions()[i]) ++changed;
    }
    EXPECT_EQ(flips, changed);
    EXPECT_EQ(model.generation(), 1u);
    EXPECT_TRUE(allBinary(model.opinions()));
}

TEST(RandomFieldIsingTest, RelaxReachesEquilibrium) {
    RandomFieldIsing model(baseConfig());
    const RelaxResult r = model.relax();

    EXPECT_TRUE(r.converged);
    EXPECT_GE(r.sweeps, 1u);
    EXPECT_EQ(model.generation(), r.sweeps);

    // Idempotent at equilibrium
    EXPECT_EQ(model.sweep(), 0u);
    const RelaxResult again = model.relax();
    EXPECT_TRUE(again.converged);
    EXPECT_EQ(again.sweeps, 1u);
    EXPECT_EQ(again.flips, 0u);
}

// With J = 0 every agent settles on sign(h_i + F)
TEST(RandomFieldIsingTest, DecoupledLimit) {
    auto cfg = baseConfig();
    cfg.coupling = 0.0;
    cfg.field = 0.3;
    RandomFieldIsing model(cfg);

    ASSERT_TRUE(model.relax().converged);
    for (std::size_t i = 0; i < model.size(); ++i) {
        const double local = model.biases()[i] + cfg.field;
        ASSERT_NE(local, 0.0);
        EXPECT_EQ(model.opinions()[i], local > 0.0 ? kPositive : kNegative) << "agent " << i;
    }
}

TEST(RandomFieldIsingTest, StrongFieldPolarizes) {
    auto cfg = baseConfig();
    cfg.field = 15.0;
    RandomFieldIsing model(cfg);

    ASSERT_TRUE(model.relax().converged);
    EXPECT_GT(model.meanOpinion(), 0.95);
}

// A local field of exactly zero never flips
TEST(RandomFieldIsingTest, ZeroLocalFieldKeepsOpinion) {
    auto cfg = baseConfig();
    cfg.coupling = 0.0;
    RandomFieldIsing model(cfg);
    const double h0 = model.biases()[0];

    model.setField(100.0);
    model.tryFlip(0);
    ASSERT_EQ(model.opinions()[0], kPositive);
    model.setField(-h0);
    ASSERT_EQ(model.localField(0), 0.0);
    EXPECT_FALSE(model.tryFlip(0));
    EXPECT_EQ(model.opinions()[0], kPositive);

    model.setField(-100.0);
    model.tryFlip(0);
    ASSERT_EQ(model.opinions()[0], kNegative);
    model.setField(-h0);
    EXPECT_FALSE(model.tryFlip(0));
    EXPECT_EQ(model.opinions()[0], kNegative);
}

TEST(RandomFieldIsingTest, TryFlipFollowsLocalField) {
    auto cfg = baseConfig();
    cfg.coupling = 0.0;
    RandomFieldIsing model(cfg);

    model.setField(100.0);
    model.tryFlip(3);
    EXPECT_EQ(model.opinions()[3], kPositive);
    EXPECT_FALSE(model.tryFlip(3));

    model.setField(-100.0);
    EXPECT_TRUE(model.tryFlip(3));
    EXPECT_EQ(model.opinions()[3], kNegative);
}

TEST(RandomFieldIsingTest, RelaxCapSignalsNonConvergence) {
    auto cfg = baseConfig();
    cfg.field = 15.0;
    cfg.maxRelaxSweeps = 1;
    RandomFieldIsing model(cfg);

    const RelaxResult r = model.relax();
    EXPECT_FALSE(r.converged);
    EXPECT_EQ(r.sweeps, 1u);
    EXPECT_GT(r.flips, 0u);
    EXPECT_EQ(model.eventLog().count(EventType::NonConvergence), 1u);
}

TEST(RandomFieldIsingTest, RelaxLogsRelaxation) {
    auto cfg = baseConfig();
    cfg.field = 15.0;
    RandomFieldIsing model(cfg);

    const RelaxResult r = model.relax();
    ASSERT_GT(r.flips, 0u);
    ASSERT_EQ(model.eventLog().count(EventType::Relaxation), 1u);
    EXPECT_EQ(model.eventLog().count(EventType::Avalanche), 0u);

    const Event& e = model.eventLog().events().back();
    EXPECT_EQ(e.value, r.flips);
    EXPECT_DOUBLE_EQ(e.field, 15.0);
    EXPECT_EQ(e.generation, model.generation());

    // A quiet relaxation adds nothing
    model.relax();
    EXPECT_EQ(model.eventLog().count(EventType::Relaxation), 1u);
}

// The avalanche is the single sweep after the kick, logged even when empty
TEST(RandomFieldIsingTest, PerturbLogsAvalanche) {
    auto cfg = baseConfig();
    cfg.field = -2.0;
    RandomFieldIsing model(cfg);
    ASSERT_TRUE(model.relax().converged);
    const auto before = model.opinions();
    const std::uint64_t generation = model.generation();

    const std::uint64_t size = model.perturb(0.5);

    std::uint64_t changed = 0;
    for (std::size_t i = 0; i < before.size(); ++i) {
        if (before[i] != model.opinions()[i]) ++changed;
    }
    EXPECT_EQ(size, changed);
    EXPECT_DOUBLE_EQ(model.field(), -1.5);
    EXPECT_EQ(model.generation(), generation + 1);

    ASSERT_EQ(model.eventLog().count(EventType::Avalanche), 1u);
    const Event& e = model.eventLog().events().back();
    EXPECT_EQ(e.type, EventType::Avalanche);
    EXPECT_EQ(e.value, size);
    EXPECT_DOUBLE_EQ(e.field, -1.5);

    EXPECT_THROW(model.perturb(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(RandomFieldIsingTest, ResetRestoresInitialState) {
    RandomFieldIsing model(baseConfig());
    const auto opinions = model.opinions();
    const auto biases = model.biases();

    model.setField(5.0);
    model.relax();
    model.reset(baseConfig());

    EXPECT_EQ(model.opinions(), opinions);
    EXPECT_EQ(model.biases(), biases);
    EXPECT_EQ(model.generation(), 0u);
    EXPECT_DOUBLE_EQ(model.field(), 0.0);
    EXPECT_TRUE(model.eventLog().events().empty());
}

TEST(RandomFieldIsingTest, InvalidParameters) {
    auto cfg = baseConfig();
    cfg.disorder = 0.0;
    EXPECT_THROW(RandomFieldIsing{cfg}, std::invalid_argument);

    cfg = baseConfig();
    cfg.population = 0;
    EXPECT_THROW(RandomFieldIsing{cfg}, std::invalid_argument);

    cfg = baseConfig();
    cfg.maxRelaxSweeps = 0;
    EXPECT_THROW(RandomFieldIsing{cfg}, std::invalid_argument);

    cfg = baseConfig();
    cfg.population = 4294967295u;
    EXPECT_THROW(RandomFieldIsing{cfg}, std::invalid_argument);
}
