#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "Bootstrap_DeltaG.hpp"
#include "CrooksBayes.h"
#include "CrooksErrors.h"
#include "CrooksMaximumLikelihood.h"
#include "Random.h"
#include "WorkResampler.h"
#include "TestHelpers.h"

namespace {

static void makeGaussianWork(double delta_g, double beta, double sigma, int n, unsigned seed,
                             std::vector<double>& wf, std::vector<double>& wb) {
    std::mt19937 engine(seed);
    const double shift = 0.5 * beta * sigma * sigma;
    std::normal_distribution<double> forward(delta_g + shift, sigma);
    std::normal_distribution<double> backward(-delta_g + shift, sigma);
    wf.resize(n);
    wb.resize(n);
    for (int i = 0; i < n; ++i) {
        wf[i] = forward(engine);
        wb[i] = backward(engine);
    }
}

static double gradientAt(const CrooksMaximumLikelihood& mle, double g) {
    CrooksMaximumLikelihood::ColumnVector x(1);
    x(0) = g;
    return mle.evalObjectiveDerivatives(x)(0);
}

static void runSymmetricSamples() {
    const std::vector<double> wf = {5.0, 5.0, 5.0};
    const std::vector<double> wb = {-5.0, -5.0, -5.0};
    CrooksMaximumLikelihood mle(wf, wb, 1.0);

    requireClose("initial guess", mle.get_delta_g_guess(), 5.0, 0.0);
    requireClose("optimum", mle.get_delta_g_opt(), 5.0, 1e-12);
    // A(5) = -2 log(1/2)
    requireClose("objective at the optimum", mle.get_min_A(), 2.0 * std::log(2.0), 1e-12);
    pass("identical samples give Delta_G = (W_F - W_B)/2");
}

static void runSolverFindsRoot() {
    // Reference values from bisection on dA/dg
    const std::vector<double> wf = {1.0, 4.0, 6.5, 2.5};
    const std::vector<double> wb = {-2.0, -0.5, -4.0, 1.0};

    CrooksMaximumLikelihood mle(wf, wb, 1.0, 1.0e-12);
    requireClose("initial guess", mle.get_delta_g_guess(), 2.4375, 1e-12);
    requireClose("optimum (beta = 1)", mle.get_delta_g_opt(), 2.33965, 1e-3);
    requireClose("gradient at the optimum", gradientAt(mle, mle.get_delta_g_opt()), 0.0, 1e-4);

    // Objective at the optimum is no larger than nearby
    CrooksMaximumLikelihood::ColumnVector x(1);
    for (double dg : {-0.1, 0.1}) {
        x(0) = mle.get_delta_g_opt() + dg;
        REQUIRE(mle.evalObjectiveFunction(x) > mle.get_min_A(), "not a minimum (offset " << dg << ")");
    }

    CrooksMaximumLikelihood half_beta(wf, wb, 0.5, 1.0e-12);
    requireClose("optimum (beta = 0.5)", half_beta.get_delta_g_opt(), 2.39205, 1e-3);

    // Explicit initial guess far from the answer
    CrooksMaximumLikelihood far_guess(wf, wb, 1.0, -8.0, 1.0e-12);
    requireClose("initial guess (explicit)", far_guess.get_delta_g_guess(), -8.0, 0.0);
    requireClose("optimum from a far guess", far_guess.get_delta_g_opt(), 2.33965, 1e-3);
    pass("BFGS solves the maximum-likelihood equation");
}

static void runAgreesWithPosterior() {
    std::vector<double> wf, wb;
    makeGaussianWork(-1.5, 1.0, 1.5, 300, 99u, wf, wb);

    CrooksMaximumLikelihood mle(wf, wb, 1.0, 1.0e-10);

    // With a flat prior the posterior is proportional to the likelihood,
    // so its peak is the maximum-likelihood estimate
    HypothesisGrid grid(-10.0, 10.0, 0.05);
    CrooksBayesEstimator estimator(grid, 1.0);
    estimator.absorbAll(wf, wb);

    requireClose("posterior mode vs. MLE", estimator.computeMode(), mle.get_delta_g_opt(), grid.getSpacing());
    const PosteriorSummary summary = estimator.getSummary();
    requireClose("posterior mean vs. MLE", summary.mean, mle.get_delta_g_opt(), 0.5 * summary.std_dev);
    pass("maximum likelihood agrees with the posterior");
}

static void runZeroBeta() {
    const std::vector<double> wf = {1.0, 3.0};
    const std::vector<double> wb = {2.0, -4.0};
    CrooksMaximumLikelihood mle(wf, wb, 0.0);
    requireClose("beta = 0 keeps the guess", mle.get_delta_g_opt(), mle.get_delta_g_guess(), 0.0);
    requireClose("beta = 0 objective", mle.get_min_A(), 2.0 * std::log(2.0), 1e-12);
    pass("beta = 0");
}

static void runInputErrors() {
    const std::vector<double> three = {1.0, 2.0, 3.0};
    const std::vector<double> two = {1.0, 2.0};
    const std::vector<double> empty;
    const std::vector<double> with_inf = {1.0, std::numeric_limits<double>::infinity()};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_THROWS(CrooksMaximumLikelihood(three, two, 1.0), SampleLengthMismatchError, "3 vs 2 samples");
    REQUIRE_THROWS(CrooksMaximumLikelihood(empty, empty, 1.0), InvalidInputError, "empty input");
    REQUIRE_THROWS(CrooksMaximumLikelihood(two, two, nan), InvalidInputError, "NaN beta");
    REQUIRE_THROWS(CrooksMaximumLikelihood(two, with_inf, 1.0), InvalidInputError, "infinite work");
    REQUIRE_THROWS(CrooksMaximumLikelihood(two, two, 1.0, 0.0), InvalidInputError, "zero tolerance");
    REQUIRE_THROWS(CrooksMaximumLikelihood(two, two, 1.0, nan, 1.0e-7), InvalidInputError, "NaN guess");
    pass("maximum-likelihood input errors");
}

static void runResampler() {
    const std::vector<int> seeds = Random::getDebugSequence();
    WorkResampler a(25, seeds);
    WorkResampler b(25, seeds);
    REQUIRE(a.getNumSamples() == 25, "getNumSamples " << a.getNumSamples());

    std::vector<int> indices_a, indices_b;
    for (int trial = 0; trial < 5; ++trial) {
        a.drawIndices(indices_a);
        b.drawIndices(indices_b);
        REQUIRE(indices_a == indices_b, "same seeds gave different indices");
        REQUIRE(indices_a.size() == 25, "index count " << indices_a.size());
        for (int idx : indices_a) {
            REQUIRE(idx >= 0 && idx < 25, "index out of range: " << idx);
        }
    }

    std::vector<double> values(25), resampled;
    for (int i = 0; i < 25; ++i) {
        values[i] = 10.0 * i;
    }
    a.draw(values, resampled);
    REQUIRE(resampled.size() == 25, "resampled size " << resampled.size());
    for (double v : resampled) {
        const double idx = v / 10.0;
        REQUIRE(idx == std::floor(idx) && idx >= 0.0 && idx < 25.0, "resampled value not from input: " << v);
    }

    REQUIRE_THROWS(a.draw(std::vector<double>(3, 1.0), resampled), std::runtime_error, "wrong series length");
    REQUIRE_THROWS(WorkResampler(0, seeds), std::runtime_error, "zero samples");
    pass("work resampler");
}

static void runBootstrap() {
    std::vector<double> wf, wb;
    makeGaussianWork(0.5, 1.0, 1.0, 100, 31u, wf, wb);
    CrooksMaximumLikelihood mle(wf, wb, 1.0);

    const int num_bootstrap = 40;
    Bootstrap_DeltaG first(num_bootstrap, Random::getDebugSequence());
    first.calculate(wf, wb, 1.0, mle.get_delta_g_opt(), 1.0e-7);
    Bootstrap_DeltaG second(num_bootstrap, Random::getDebugSequence());
    second.calculate(wf, wb, 1.0, mle.get_delta_g_opt(), 1.0e-7);

    REQUIRE(first.getNumBootstrapSamples() == num_bootstrap, "num bootstrap samples");
    REQUIRE(static_cast<int>(first.getSamples().size()) == num_bootstrap, "samples size");
    REQUIRE(first.getSamples() == second.getSamples(), "debug seeds should reproduce the bootstrap");

    const double err = first.std_dev();
    requireFinite(err, "bootstrap error");
    REQUIRE(err > 0.0 && err < 1.0, "implausible bootstrap error " << err);
    requireClose("bootstrap average", first.average(), mle.get_delta_g_opt(), 5.0 * err);

    const std::vector<double> convergence = first.computeConvergence();
    REQUIRE(static_cast<int>(convergence.size()) == num_bootstrap - 1, "convergence size " << convergence.size());
    requireClose("convergence end", convergence.back(), err, 1e-14);
    pass("bootstrap errors are reproducible and finite");
}

static void runBootstrapIdenticalSamples() {
    const std::vector<double> wf(10, 5.0);
    const std::vector<double> wb(10, -5.0);
    Bootstrap_DeltaG bootstrap(10, Random::getDebugSequence());
    bootstrap.calculate(wf, wb, 1.0, 5.0, 1.0e-7);
    requireClose("no spread", bootstrap.std_dev(), 0.0, 0.0);
    requireClose("value", bootstrap.average(), 5.0, 0.0);

    REQUIRE_THROWS(Bootstrap_DeltaG(1, Random::getDebugSequence()), std::runtime_error, "one bootstrap sample");
    REQUIRE_THROWS(bootstrap.calculate(wf, std::vector<double>(9, -5.0), 1.0, 5.0, 1.0e-7),
                   SampleLengthMismatchError, "bootstrap with unequal lengths");
    pass("bootstrap of identical samples");
}

} // namespace

int main() {
    runSymmetricSamples();
    runSolverFindsRoot();
    runAgreesWithPosterior();
    runZeroBeta();
    runInputErrors();
    runResampler();
    runBootstrap();
    runBootstrapIdenticalSamples();

    std::cout << "All maximum-likelihood tests passed.\n";
    return 0;
}
