#ifndef OPINION_SNAPSHOT_H
#define OPINION_SNAPSHOT_H

#include "kernel/SocialLearning.h"
#include "kernel/RandomFieldIsing.h"
#include "modules/FixedPoint.h"
#include "modules/Hysteresis.h"
#include <string>
#include <iosfwd>
#include <vector>

// JSON export for model state
std::string socialToJson(const SocialLearning& model, bool includeOpinions = false);
std::string isingToJson(const RandomFieldIsing& model, bool includeOpinions = false);
std::string fixedPointsToJson(double z, double p, int m, const FixedPoints& fp);

// CSV logging
void logTrace(const SocialLearning::Trace& trace, std::ostream& out);
void logHysteresis(const std::vector<HysteresisPoint>& loop, std::ostream& out);
void logFixedPointCurve(const std::vector<FixedPointCurvePoint>& curve, std::ostream& out);

#endif
