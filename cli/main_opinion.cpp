#include "kernel/SocialLearning.h"
#include "kernel/RandomFieldIsing.h"
#include "modules/FixedPoint.h"
#include "modules/Hysteresis.h"
#include "io/Snapshot.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstdlib>
#include <string>

static void printHelp() {
    std::cerr << "Opinion Dynamics Commands:\n"
              << "  social reset [N z p m]        # informed/follower model (pop, informed fraction, accuracy, poll size)\n"
              << "  social step N                 # advance N single-follower steps\n"
              << "  social run T [file.csv]       # run T steps, print tail accuracy, optional trace CSV\n"
              << "  social state [opinions]       # print JSON snapshot\n"
              << "  social sweep z0 z1 n T        # long-run follower accuracy over n values of z\n"
              << "  ising reset [J F N delta]     # random-field Ising model\n"
              << "  ising field F                 # set external field\n"
              << "  ising relax                   # sweep to equilibrium\n"
              << "  ising state [opinions]        # print JSON snapshot\n"
              << "  ising loop Fmax n [file.csv]  # hysteresis loop -Fmax..Fmax..-Fmax, n points per branch\n"
              << "  ising avalanches dF count     # avalanche sizes after field kicks of dF\n"
              << "  ising events                  # dump event log as CSV\n"
              << "  fixed z p m                   # mean-field fixed points\n"
              << "  fixed curve z0 z1 n p m [csv] # fixed points over n values of z\n"
              << "  help                          # show this list\n"
              << "  quit                          # exit\n"
              << "\nOptions: --seed=<n> (or OPINION_SEED env var), --tie=negative|positive|keep, --verbose\n";
}

static std::vector<double> linspace(double from, double to, std::size_t n) {
    return makeFieldRamp(from, to, n);
}

static bool openCsv(const std::string& path, std::ofstream& out) {
    if (path.empty()) return false;
    out.open(path);
    if (!out.is_open()) {
        std::cerr << "Error: Could not open '" << path << "' for writing\n";
        return false;
    }
    return true;
}

static void handleSocial(std::istringstream& iss, SocialLearningConfig& cfg, SocialLearning& model) {
    std::string sub;
    iss >> sub;

    if (sub == "reset") {
        SocialLearningConfig nc = cfg;
        iss >> nc.population >> nc.informedFraction >> nc.informedAccuracy >> nc.pollSize;
        model.reset(nc);
        cfg = nc;
        std::cout << "Reset: " << model.informedCount() << " informed, "
                  << model.followerCount() << " followers (p=" << cfg.informedAccuracy
                  << ", m=" << cfg.pollSize << ")\n";

    } else if (sub == "step") {
        int n = 1;
        iss >> n;
        if (n < 1) n = 1;
        model.stepN(n);
        std::cout << socialToJson(model) << "\n";

    } else if (sub == "run") {
        std::size_t steps = 1000;
        std::string path;
        iss >> steps >> path;

        auto trace = model.run(steps);
        std::ofstream csv;
        if (openCsv(path, csv)) {
            logTrace(trace, csv);
            std::cerr << "Trace written to " << path << "\n";
        }
        std::cout << std::fixed << std::setprecision(4)
                  << "Completed " << steps << " steps (generation " << model.generation() << ")\n"
                  << "Follower accuracy: " << model.computeFollowerAccuracy()
                  << " (tail mean " << tailMean(trace.followerAccuracy, 0.5) << ")\n"
                  << "Overall accuracy: " << model.computeOverallAccuracy()
                  << " (tail mean " << tailMean(trace.overallAccuracy, 0.5) << ")\n";

    } else if (sub == "state") {
        std::string opt;
        iss >> opt;
        std::cout << socialToJson(model, opt == "opinions") << "\n";

    } else if (sub == "sweep") {
        double z0 = 0.0, z1 = 1.0;
        std::size_t n = 11, steps = 10000;
        iss >> z0 >> z1 >> n >> steps;

        auto points = sweepInformedFraction(cfg, linspace(z0, z1, n), steps);
        std::cout << std::fixed << std::setprecision(4) << "z,q\n";
        for (const auto& pt : points) {
            std::cout << pt.informedFraction << "," << pt.followerAccuracy << "\n";
        }

    } else {
        std::cerr << "Usage: social reset|step|run|state|sweep ...\n";
    }
}

static void handleIsing(std::istringstream& iss, IsingConfig& cfg, RandomFieldIsing& model) {
    std::string sub;
    iss >> sub;

    if (sub == "reset") {
        IsingConfig nc = cfg;
        iss >> nc.coupling >> nc.field >> nc.population >> nc.disorder;
        model.reset(nc);
        cfg = nc;
        std::cout << "Reset: " << model.size() << " agents (J=" << cfg.coupling
                  << ", F=" << cfg.field << ", delta=" << model.disorder() << ")\n";

    } else if (sub == "field") {
        double f = model.field();
        iss >> f;
        model.setField(f);
        std::cout << "Field: " << model.field() << "\n";

    } else if (sub == "relax") {
        const RelaxResult r = model.relax();
        std::cout << std::fixed << std::setprecision(4)
                  << "Relaxed in " << r.sweeps << " sweeps, " << r.flips << " flips"
                  << (r.converged ? "" : " (NOT converged)") << "\n"
                  << "Mean opinion: " << model.meanOpinion() << "\n";

    } else if (sub == "state") {
        std::string opt;
        iss >> opt;
        std::cout << isingToJson(model, opt == "opinions") << "\n";

    } else if (sub == "loop") {
        double fmax = 3.0;
        std::size_t n = 61;
        std::string path;
        iss >> fmax >> n >> path;

        const auto fields = makeHysteresisFields(fmax, n);
        auto loop = hysteresisLoop(model, fields);
        std::ofstream csv;
        if (openCsv(path, csv)) {
            logHysteresis(loop, csv);
            std::cerr << "Hysteresis loop written to " << path << "\n";
        } else {
            std::cout << std::fixed << std::setprecision(4);
            logHysteresis(loop, std::cout);
        }
        const auto unconverged = std::count_if(loop.begin(), loop.end(),
            [](const HysteresisPoint& pt) { return !pt.converged; });
        if (unconverged > 0) {
            std::cerr << "Warning: " << unconverged << " field values did not reach equilibrium\n";
        }

    } else if (sub == "avalanches") {
        double dF = 0.01;
        std::size_t count = 100;
        iss >> dF >> count;

        auto sizes = sampleAvalanches(model, dF, count);
        auto histogram = avalancheHistogram(sizes);
        std::cout << "size,count\n";
        for (const auto& [size, occurrences] : histogram) {
            std::cout << size << "," << occurrences << "\n";
        }
        std::cout << "Final field: " << model.field() << "\n";

    } else if (sub == "events") {
        model.eventLog().writeCsv(std::cout);
        if (model.eventLog().dropped() > 0) {
            std::cerr << model.eventLog().dropped() << " older events dropped\n";
        }

    } else {
        std::cerr << "Usage: ising reset|field|relax|state|loop|avalanches|events ...\n";
    }
}

static void handleFixed(std::istringstream& iss, const FixedPointConfig& fpCfg) {
    std::string first;
    iss >> first;

    if (first == "curve") {
        double z0 = 0.0, z1 = 1.0, p = 0.52;
        std::size_t n = 21;
        int m = 11;
        std::string path;
        iss >> z0 >> z1 >> n >> p >> m >> path;

        auto curve = fixedPointCurve(linspace(z0, z1, n), p, m, fpCfg);
        std::ofstream csv;
        if (openCsv(path, csv)) {
            logFixedPointCurve(curve, csv);
            std::cerr << "Fixed-point curve written to " << path << "\n";
        } else {
            std::cout << std::fixed << std::setprecision(6);
            logFixedPointCurve(curve, std::cout);
        }
        return;
    }

    double z = std::stod(first);
    double p = 0.52;
    int m = 11;
    iss >> p >> m;
    try {
        std::cout << fixedPointsToJson(z, p, m, findFixedPoints(z, p, m, fpCfg)) << "\n";
    } catch (const RootBracketError& e) {
        std::cout << std::fixed << std::setprecision(6)
                  << "Single stable regime: lower=" << e.lower() << ", upper=" << e.upper() << "\n";
        std::cerr << "No interior fixed point: " << e.what() << "\n";
    }
}

int main(int argc, char** argv) {
    SocialLearningConfig socialCfg;
    IsingConfig isingCfg;
    FixedPointConfig fpCfg;
    bool verbose = false;

    if (const char* envSeed = std::getenv("OPINION_SEED")) {
        if (!opinion::parseSeed(envSeed, socialCfg.seed)) {
            std::cerr << "Invalid OPINION_SEED: '" << envSeed << "'\n";
            return 1;
        }
        isingCfg.seed = socialCfg.seed;
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--seed=", 0) == 0) {
            if (!opinion::parseSeed(arg.substr(7), socialCfg.seed)) {
                std::cerr << "Invalid seed: '" << arg.substr(7) << "'\n";
                return 1;
            }
            isingCfg.seed = socialCfg.seed;
        } else if (arg.rfind("--tie=", 0) == 0) {
            if (!opinion::parseTieBreak(arg.substr(6), socialCfg.tieBreak)) {
                std::cerr << "Unknown tie-break rule: " << arg.substr(6) << "\n";
                return 1;
            }
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg.size() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    SocialLearning social(socialCfg);
    RandomFieldIsing ising(isingCfg);

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    int lineCount = 0;
    while (std::getline(*input, line)) {
        lineCount++;
        if (verbose) {
            std::cerr << "[DEBUG] Line " << lineCount << ": '" << line << "'\n";
        }

        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd) || cmd[0] == '#') {
            continue;
        }

        try {
            if (cmd == "social") {
                handleSocial(iss, socialCfg, social);
            } else if (cmd == "ising") {
                handleIsing(iss, isingCfg, ising);
            } else if (cmd == "fixed") {
                handleFixed(iss, fpCfg);
            } else if (cmd == "help") {
                printHelp();
            } else if (cmd == "quit") {
                break;
            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
                printHelp();
            }
        } catch (const std::exception& e) {
            std::cerr << "Error in " << cmd << " command: " << e.what() << "\n";
        }
        std::cout.flush();
    }
    return 0;
}
