#include <gtest/gtest.h>
#include "io/Snapshot.h"
#include <limits>
#include <sstream>
#include <string>

namespace {

std::size_t countLines(const std::string& text) {
    std::size_t n = 0;
    for (char c : text) if (c == '\n') ++n;
    return n;
}

} // namespace

TEST(SnapshotTest, SocialJson) {
    SocialLearningConfig cfg;
    cfg.population = 20;
    SocialLearning model(cfg);

    const std::string json = socialToJson(model);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"model\":\"social\""), std::string::npos);
    EXPECT_NE(json.find("\"followerAccuracy\":"), std::string::npos);
    EXPECT_NE(json.find("\"tieBreak\":\"negative\""), std::string::npos);
    EXPECT_EQ(json.find("\"opinions\""), std::string::npos);

    const std::string full = socialToJson(model, true);
    EXPECT_NE(full.find("\"opinions\":["), std::string::npos);
}

TEST(SnapshotTest, IsingJson) {
    IsingConfig cfg;
    cfg.population = 10;
    RandomFieldIsing model(cfg);

    const std::string json = isingToJson(model);
    EXPECT_NE(json.find("\"model\":\"ising\""), std::string::npos);
    EXPECT_NE(json.find("\"meanOpinion\":"), std::string::npos);
    EXPECT_NE(json.find("\"delta\":1.2000"), std::string::npos);
    EXPECT_EQ(json.find("\"biases\""), std::string::npos);

    const std::string full = isingToJson(model, true);
    EXPECT_NE(full.find("\"opinions\":["), std::string::npos);
    EXPECT_NE(full.find("\"biases\":["), std::string::npos);
}

TEST(SnapshotTest, IsingJsonSeparatesAvalanchesFromRelaxations) {
    IsingConfig cfg;
    cfg.population = 200;
    cfg.field = 15.0;
    RandomFieldIsing model(cfg);

    ASSERT_TRUE(model.relax().converged);
    model.perturb(0.1);
    model.perturb(0.1);

    const std::string json = isingToJson(model);
    EXPECT_NE(json.find("\"avalanches\":2,"), std::string::npos);
    EXPECT_NE(json.find("\"relaxations\":1,"), std::string::npos);
    EXPECT_NE(json.find("\"nonConvergence\":0"), std::string::npos);
}

TEST(SnapshotTest, FixedPointsJson) {
    FixedPoints fp;
    fp.lower = 0.1;
    fp.upper = 0.9;
    fp.middle = 0.5;
    const std::string json = fixedPointsToJson(0.2, 0.52, 11, fp);
    EXPECT_NE(json.find("\"m\":11"), std::string::npos);
    EXPECT_NE(json.find("\"middle\":0.500000"), std::string::npos);
}

TEST(SnapshotTest, TraceCsv) {
    SocialLearning::Trace trace;
    trace.followerAccuracy = {0.5, 0.6, 0.7};
    trace.overallAccuracy = {0.4, 0.5, 0.6};

    std::ostringstream os;
    logTrace(trace, os);
    const std::string csv = os.str();
    EXPECT_EQ(csv.rfind("t,follower_accuracy,overall_accuracy\n", 0), 0u);
    EXPECT_EQ(countLines(csv), 4u);
    EXPECT_NE(csv.find("2,0.7,0.6\n"), std::string::npos);
}

TEST(SnapshotTest, HysteresisCsv) {
    HysteresisPoint pt;
    pt.field = 1.5;
    pt.meanOpinion = -0.25;
    pt.flips = 12;
    pt.sweeps = 3;
    pt.converged = false;

    std::ostringstream os;
    logHysteresis({pt}, os);
    EXPECT_EQ(os.str(), "field,mean_opinion,flips,sweeps,converged\n1.5,-0.25,12,3,0\n");
}

TEST(SnapshotTest, FixedPointCurveCsvLeavesMissingMiddleEmpty) {
    FixedPointCurvePoint bistable;
    bistable.informedFraction = 0.0;
    bistable.lower = 0.0;
    bistable.upper = 1.0;
    bistable.middle = 0.5;
    bistable.hasMiddle = true;

    FixedPointCurvePoint single;
    single.informedFraction = 1.0;
    single.lower = 0.75;
    single.upper = 0.75;
    single.middle = std::numeric_limits<double>::quiet_NaN();
    single.hasMiddle = false;

    std::ostringstream os;
    logFixedPointCurve({bistable, single}, os);
    EXPECT_EQ(os.str(),
              "z,q_lower,q_upper,q_middle,has_middle\n"
              "0,0,1,0.5,1\n"
              "1,0.75,0.75,,0\n");
}
