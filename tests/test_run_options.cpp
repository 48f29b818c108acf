///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "diagnostics.hpp"
#include "problem_context.hpp"
#include "run_options.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

RunOptions parse(std::vector<std::string> args, int defaultThreads = 1) {
    args.insert(args.begin(), "uctp");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(&a[0]);
    return parseRunOptions((int)argv.size(), argv.data(), defaultThreads);
}

} // namespace


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(RunOptionsTest, DefaultsWithoutFlags) {
    RunOptions opts = parse({}, 4);
    EXPECT_EQ(opts.size, DemoSize::S);
    EXPECT_EQ(opts.config.numThreads, 4);
    EXPECT_EQ(opts.config.populationSize, 20);
    EXPECT_EQ(opts.candidateCount, 3);
    EXPECT_FALSE(opts.verbose);
    EXPECT_FALSE(opts.help);
}

TEST(RunOptionsTest, ReadsEveryFlag) {
    RunOptions opts = parse({"--size", "L", "--threads", "8", "--seed", "7", "--generations", "40",
                             "--population", "30", "--candidates", "5", "--verbose"});
    EXPECT_EQ(opts.size, DemoSize::L);
    EXPECT_EQ(opts.config.numThreads, 8);
    EXPECT_EQ(opts.config.seed, 7u);
    EXPECT_EQ(opts.config.targetGenerations, 40);
    EXPECT_EQ(opts.config.populationSize, 30);
    EXPECT_EQ(opts.candidateCount, 5);
    EXPECT_TRUE(opts.verbose);
    EXPECT_TRUE(parse({"-h"}).help);
}

TEST(RunOptionsTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--size", "XL"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threads", "four"}), std::invalid_argument);
    EXPECT_THROW(parse({"--seed", "12abc"}), std::invalid_argument);
    EXPECT_THROW(parse({"--population"}), std::invalid_argument);
    EXPECT_THROW(parse({"--colour", "red"}), std::invalid_argument);
    EXPECT_NE(usage("uctp").find("--candidates"), std::string::npos);
}

TEST(DemoInstancesTest, EveryDemoIsValidAndStaffed) {
    for (DemoSize size : {DemoSize::S, DemoSize::M, DemoSize::L}) {
        ProblemInstance inst = makeDemoInstance(size);
        EXPECT_NO_THROW(ProblemContext ctx(inst));
        EXPECT_FALSE(hasCriticalIssues(runPreflightDiagnostics(inst)));
        EXPECT_FALSE(inst.pinnedAssignments.empty());
    }
}
