#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <ostream>
#include <algorithm>

namespace {

void appendOpinions(std::ostream& os, const std::vector<Opinion>& opinions) {
    os << "[";
    for (std::size_t i = 0; i < opinions.size(); ++i) {
        os << static_cast<int>(opinions[i]);
        if (i + 1 < opinions.size()) os << ",";
    }
    os << "]";
}

} // namespace

std::string socialToJson(const SocialLearning& model, bool includeOpinions) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    const auto& cfg = model.config();
    os << "{";
    os << "\"model\":\"social\",";
    os << "\"generation\":" << model.generation() << ",";
    os << "\"params\":{";
    os << "\"N\":" << cfg.population << ",";
    os << "\"z\":" << cfg.informedFraction << ",";
    os << "\"p\":" << cfg.informedAccuracy << ",";
    os << "\"m\":" << cfg.pollSize << ",";
    os << "\"tieBreak\":\"" << opinion::tieBreakName(cfg.tieBreak) << "\",";
    os << "\"seed\":" << cfg.seed;
    os << "},";
    os << "\"metrics\":{";
    os << "\"informed\":" << model.informedCount() << ",";
    os << "\"followers\":" << model.followerCount() << ",";
    os << "\"followerAccuracy\":" << model.computeFollowerAccuracy() << ",";
    os << "\"overallAccuracy\":" << model.computeOverallAccuracy() << ",";
    os << "\"informedAccuracy\":" << model.computeInformedAccuracy();
    os << "}";

    if (includeOpinions) {
        os << ",\"opinions\":";
        appendOpinions(os, model.opinions());
    }
    os << "}";
    return os.str();
}

std::string isingToJson(const RandomFieldIsing& model, bool includeOpinions) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    const auto& cfg = model.config();
    os << "{";
    os << "\"model\":\"ising\",";
    os << "\"generation\":" << model.generation() << ",";
    os << "\"params\":{";
    os << "\"J\":" << cfg.coupling << ",";
    os << "\"F\":" << cfg.field << ",";
    os << "\"N\":" << cfg.population << ",";
    os << "\"delta\":" << model.disorder() << ",";
    os << "\"seed\":" << cfg.seed;
    os << "},";
    os << "\"metrics\":{";
    os << "\"meanOpinion\":" << model.meanOpinion() << ",";
    os << "\"avalanches\":" << model.eventLog().count(EventType::Avalanche) << ",";
    os << "\"relaxations\":" << model.eventLog().count(EventType::Relaxation) << ",";
    os << "\"nonConvergence\":" << model.eventLog().count(EventType::NonConvergence);
    os << "}";

    if (includeOpinions) {
        os << ",\"opinions\":";
        appendOpinions(os, model.opinions());
        os << ",\"biases\":[";
        const auto& h = model.biases();
        for (std::size_t i = 0; i < h.size(); ++i) {
            os << h[i];
            if (i + 1 < h.size()) os << ",";
        }
        os << "]";
    }
    os << "}";
    return os.str();
}

std::string fixedPointsToJson(double z, double p, int m, const FixedPoints& fp) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(6);
    os << "{";
    os << "\"z\":" << z << ",";
    os << "\"p\":" << p << ",";
    os << "\"m\":" << m << ",";
    os << "\"lower\":" << fp.lower << ",";
    os << "\"upper\":" << fp.upper << ",";
    os << "\"middle\":" << fp.middle;
    os << "}";
    return os.str();
}

void logTrace(const SocialLearning::Trace& trace, std::ostream& out) {
    out << "t,follower_accuracy,overall_accuracy\n";
    const std::size_t n = std::min(trace.followerAccuracy.size(), trace.overallAccuracy.size());
    for (std::size_t t = 0; t < n; ++t) {
        out << t << ","
            << trace.followerAccuracy[t] << ","
            << trace.overallAccuracy[t] << "\n";
    }
}

void logHysteresis(const std::vector<HysteresisPoint>& loop, std::ostream& out) {
    out << "field,mean_opinion,flips,sweeps,converged\n";
    for (const auto& pt : loop) {
        out << pt.field << ","
            << pt.meanOpinion << ","
            << pt.flips << ","
            << pt.sweeps << ","
            << (pt.converged ? 1 : 0) << "\n";
    }
}

void logFixedPointCurve(const std::vector<FixedPointCurvePoint>& curve, std::ostream& out) {
    out << "z,q_lower,q_upper,q_middle,has_middle\n";
    for (const auto& pt : curve) {
        out << pt.informedFraction << ","
            << pt.lower << ","
            << pt.upper << ",";
        if (pt.hasMiddle) {
            out << pt.middle;
        }
        out << "," << (pt.hasMiddle ? 1 : 0) << "\n";
    }
}
