///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "run_options.hpp"
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

DemoSize parseSize(const std::string& value) {
    if (value == "S" || value == "s") return DemoSize::S;
    if (value == "M" || value == "m") return DemoSize::M;
    if (value == "L" || value == "l") return DemoSize::L;
    throw std::invalid_argument("--size expects S, M or L, got '" + value + "'");
}

} // namespace


///////////////////////////
///       OPTIONS       ///
///////////////////////////
RunOptions parseRunOptions(int argc, char** argv, int defaultThreads) {
    RunOptions opts;
    opts.config.numThreads = defaultThreads;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (flag == "--help" || flag == "-h") {
            opts.help = true;
            continue;
        }
        if (i + 1 >= argc) throw std::invalid_argument("missing value for " + flag);
        std::string value = argv[++i];

        if (flag == "--size") opts.size = parseSize(value);
        else if (flag == "--threads") opts.config.numThreads = parseInt(flag, value);
        else if (flag == "--seed") opts.config.seed = (unsigned)parseInt(flag, value);
        else if (flag == "--generations") opts.config.targetGenerations = parseInt(flag, value);
        else if (flag == "--population") opts.config.populationSize = parseInt(flag, value);
        else if (flag == "--candidates") opts.candidateCount = parseInt(flag, value);
        else throw std::invalid_argument("unknown option " + flag);
    }
    return opts;
}

std::string usage(const std::string& program) {
    return "usage: " + program +
           " [--size S|M|L] [--threads N] [--seed N] [--generations N]"
           " [--population N] [--candidates N] [--verbose]\n";
}
