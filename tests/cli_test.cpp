#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <stdexcept>
#include <vector>

#include "fastpass/cli.hpp"

using namespace fastpass;

namespace {

bool parse(std::vector<const char*> args, CliOptions& opts, std::string* errors = nullptr) {
    args.insert(args.begin(), "fastpass_sim");
    std::ostringstream err;
    bool ok = parseArgs(static_cast<int>(args.size()), args.data(), opts, err);
    if (errors) *errors = err.str();
    return ok;
}

} // namespace

TEST(Cli, Defaults) {
    CliOptions opts;
    ASSERT_TRUE(parse({}, opts));
    EXPECT_EQ(opts.sweep.arrivalRates, (std::vector<double>{0.5, 0.95}));
    ASSERT_EQ(opts.sweep.fractions.size(), 20u);
    EXPECT_DOUBLE_EQ(opts.sweep.fractions.back(), 0.95);
    EXPECT_DOUBLE_EQ(opts.sweep.horizon, 50000.0);
    EXPECT_DOUBLE_EQ(opts.sweep.warmup, 5000.0);
    EXPECT_EQ(opts.sweep.seed, 42u);
    EXPECT_FALSE(opts.singleFraction.has_value());
    EXPECT_EQ(opts.outdir, ".");
}

TEST(Cli, ParsesSweepOptions) {
    CliOptions opts;
    ASSERT_TRUE(parse({"--rates", "0.3,0.6,0.9", "--mu", "2", "--fsteps", "5", "--fmax", "0.8",
                       "--horizonT", "1000", "--warmup", "100", "--seed", "7", "--reps", "4",
                       "--threads", "3", "--threshold", "3.5", "--maxRatio", "10",
                       "--outdir", "/tmp/out", "--quiet"}, opts));
    EXPECT_EQ(opts.sweep.arrivalRates, (std::vector<double>{0.3, 0.6, 0.9}));
    EXPECT_DOUBLE_EQ(opts.sweep.serviceRate, 2.0);
    ASSERT_EQ(opts.sweep.fractions.size(), 5u);
    EXPECT_DOUBLE_EQ(opts.sweep.fractions[1], 0.2);
    EXPECT_DOUBLE_EQ(opts.sweep.horizon, 1000.0);
    EXPECT_DOUBLE_EQ(opts.sweep.warmup, 100.0);
    EXPECT_EQ(opts.sweep.seed, 7u);
    EXPECT_EQ(opts.sweep.reps, 4);
    EXPECT_EQ(opts.sweep.threads, 3);
    EXPECT_DOUBLE_EQ(opts.sweep.policy.mm1Multiple, 3.5);
    ASSERT_TRUE(opts.sweep.policy.maxRatio.has_value());
    EXPECT_DOUBLE_EQ(*opts.sweep.policy.maxRatio, 10.0);
    EXPECT_EQ(opts.outdir, "/tmp/out");
    EXPECT_TRUE(opts.quiet);
}

TEST(Cli, ExplicitFractionsWin) {
    CliOptions opts;
    ASSERT_TRUE(parse({"--fsteps", "3", "--fractions", "0.1,0.65"}, opts));
    EXPECT_EQ(opts.sweep.fractions, (std::vector<double>{0.1, 0.65}));
}

TEST(Cli, SingleRunNeedsOneRate) {
    CliOptions opts;
    std::string errors;
    EXPECT_FALSE(parse({"--f", "0.65"}, opts, &errors));
    EXPECT_NE(errors.find("exactly one arrival rate"), std::string::npos);

    CliOptions single;
    ASSERT_TRUE(parse({"--rates", "0.95", "--f", "0.65"}, single));
    ASSERT_TRUE(single.singleFraction.has_value());
    EXPECT_EQ(single.sweep.fractions, std::vector<double>{0.65});
}

TEST(Cli, BadInputIsReported) {
    CliOptions opts;
    std::string errors;
    EXPECT_FALSE(parse({"--mu", "fast"}, opts, &errors));
    EXPECT_NE(errors.find("Bad value for --mu"), std::string::npos);

    EXPECT_FALSE(parse({"--bogus"}, opts, &errors));
    EXPECT_NE(errors.find("Unknown or incomplete option: --bogus"), std::string::npos);
    EXPECT_NE(errors.find("Usage:"), std::string::npos);

    EXPECT_FALSE(parse({"--rates"}, opts, &errors));
    EXPECT_FALSE(parse({"--fsteps", "0"}, opts, &errors));
    EXPECT_FALSE(parse({"--rates", "0.5,,0.9"}, opts, &errors));
}

TEST(Cli, NumbersMustBeWholeTokens) {
    CliOptions opts;
    std::string errors;
    EXPECT_FALSE(parse({"--reps", "2.7"}, opts, &errors));
    EXPECT_NE(errors.find("Bad value for --reps: 2.7"), std::string::npos);
    EXPECT_EQ(opts.sweep.reps, 1);

    EXPECT_FALSE(parse({"--horizonT", "1.0abc"}, opts, &errors));
    EXPECT_NE(errors.find("Bad value for --horizonT"), std::string::npos);
    EXPECT_FALSE(parse({"--threads", "4x"}, opts, &errors));
    EXPECT_FALSE(parse({"--mu", "1.0abc"}, opts, &errors));
}

TEST(Cli, NegativeSeedIsRejected) {
    CliOptions opts;
    std::string errors;
    EXPECT_FALSE(parse({"--seed", "-1"}, opts, &errors));
    EXPECT_NE(errors.find("Bad value for --seed: -1"), std::string::npos);
    EXPECT_EQ(opts.sweep.seed, 42u);

    EXPECT_FALSE(parse({"--seed", "12abc"}, opts, &errors));

    CliOptions ok;
    ASSERT_TRUE(parse({"--seed", "18446744073709551615"}, ok));
    EXPECT_EQ(ok.sweep.seed, 18446744073709551615ull);
}

TEST(Cli, HelpFlag) {
    CliOptions opts;
    ASSERT_TRUE(parse({"--help"}, opts));
    EXPECT_TRUE(opts.help);

    std::ostringstream usage;
    print_usage(usage, "fastpass_sim");
    EXPECT_NE(usage.str().find("--threshold"), std::string::npos);
}

TEST(Cli, ParseList) {
    EXPECT_EQ(parse_list("0.5"), std::vector<double>{0.5});
    EXPECT_THROW(parse_list("0.5x"), std::invalid_argument);
    EXPECT_THROW(parse_list(""), std::invalid_argument);
}

namespace {

int run(std::vector<const char*> args, std::string& out, std::string& err) {
    args.insert(args.begin(), "fastpass_sim");
    std::ostringstream o, e;
    int status = run_cli(static_cast<int>(args.size()), args.data(), o, e);
    out = o.str();
    err = e.str();
    return status;
}

} // namespace

TEST(CliRun, SingleRunSucceeds) {
    std::string out, err;
    EXPECT_EQ(run({"--rates", "0.5", "--f", "0.3", "--horizonT", "500", "--warmup", "50"}, out, err), 0);
    EXPECT_NE(out.find("single run"), std::string::npos);
    EXPECT_NE(out.find("priority: mean="), std::string::npos);
    EXPECT_TRUE(err.empty());
}

TEST(CliRun, HelpExitsZero) {
    std::string out, err;
    EXPECT_EQ(run({"--help"}, out, err), 0);
    EXPECT_NE(out.find("Usage:"), std::string::npos);
}

TEST(CliRun, FailuresExitOneWithMessage) {
    std::string out, err;
    EXPECT_EQ(run({"--reps", "2.7"}, out, err), 1);
    EXPECT_NE(err.find("Bad value for --reps"), std::string::npos);

    EXPECT_EQ(run({"--rates", "0.5", "--f", "0.3", "--horizonT", "100", "--warmup", "200"}, out, err), 1);
    EXPECT_NE(err.find("Configuration error:"), std::string::npos);

    EXPECT_EQ(run({"--rates", "0.5,0.5", "--fractions", "0.3", "--horizonT", "100", "--warmup", "10"}, out, err), 1);
    EXPECT_NE(err.find("appears more than once"), std::string::npos);

    EXPECT_EQ(run({"--rates", "0.5", "--fractions", "0.3", "--horizonT", "200", "--warmup", "20",
                   "--quiet", "--outdir", "/nonexistent-dir/for/sure"}, out, err), 1);
    EXPECT_NE(err.find("Error: cannot open"), std::string::npos);
}
