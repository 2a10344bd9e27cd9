#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "Logistic.hpp"
#include "Trapezoid.hpp"
#include "TestHelpers.h"

namespace {

static void runLogisticBasics() {
    requireClose("s(0)", numeric::logistic(0.0), 0.5, 0.0);
    requireClose("s(1)", numeric::logistic(1.0), 1.0 / (1.0 + std::exp(1.0)), 1e-15);
    requireClose("s(-2)", numeric::logistic(-2.0), 1.0 / (1.0 + std::exp(-2.0)), 1e-15);

    // Decreasing, with s(-z) = 1 - s(z)
    double last = 1.0;
    for (double z = -40.0; z <= 40.0; z += 0.5) {
        const double s = numeric::logistic(z);
        REQUIRE(s <= last, "logistic is not decreasing at z = " << z);
        requireClose("symmetry", numeric::logistic(-z), 1.0 - s, 1e-15);
        last = s;
    }

    pass("logistic: values, monotonicity, symmetry");
}

static void runLogisticSaturation() {
    const double inf = std::numeric_limits<double>::infinity();
    const double big[] = {50.0, 750.0, 1.0e6, 1.0e300, inf};

    for (double z : big) {
        const double s_pos = numeric::logistic(z);
        const double s_neg = numeric::logistic(-z);
        REQUIRE(!std::isnan(s_pos) && !std::isnan(s_neg), "NaN at |z| = " << z);
        REQUIRE(s_pos >= 0.0 && s_pos < 1.0e-20, "s(" << z << ") = " << s_pos);
        requireClose("s(-large)", s_neg, 1.0, 1.0e-20);
    }
    requireClose("s(+inf)", numeric::logistic(inf), 0.0, 0.0);
    requireClose("s(-inf)", numeric::logistic(-inf), 1.0, 0.0);

    pass("logistic saturates without overflow");
}

static void runLogisticVector() {
    const std::vector<double> z = {-3.0, -0.5, 0.0, 0.5, 1000.0};
    const std::vector<double> s = numeric::logistic(z);
    REQUIRE(s.size() == z.size(), "size mismatch");
    for (unsigned i = 0; i < z.size(); ++i) {
        requireClose("elementwise", s[i], numeric::logistic(z[i]), 0.0);
    }

    std::vector<double> out(1, -1.0);
    numeric::logistic(z, out);
    REQUIRE(out.size() == z.size(), "output buffer was not resized");

    pass("logistic: elementwise");
}

static void runLogLogistic() {
    for (double z = -30.0; z <= 30.0; z += 0.25) {
        requireClose("log s(z)", numeric::logLogistic(z), std::log(numeric::logistic(z)), 1e-12);
    }
    // Far tails: log s(z) ~ -z for large z, ~ 0 for very negative z
    requireClose("log s(1000)", numeric::logLogistic(1000.0), -1000.0, 1e-9);
    requireClose("log s(-1000)", numeric::logLogistic(-1000.0), 0.0, 1e-300);
    requireFinite(numeric::logLogistic(1.0e300), "log s(1e300)");

    pass("log-logistic is stable");
}

static void runTrapezoid() {
    // Linear functions are integrated exactly, on any grid
    const std::vector<double> x = {0.0, 0.1, 0.5, 0.6, 2.0};
    std::vector<double> y(x.size());
    for (unsigned i = 0; i < x.size(); ++i) {
        y[i] = 3.0 * x[i] + 1.0;
    }
    requireClose("integral of 3x + 1 on [0,2]", numeric::trapz(x, y), 8.0, 1e-14);

    // Constant on two points
    requireClose("two points", numeric::trapz(std::vector<double>{1.0, 4.0}, std::vector<double>{2.0, 2.0}),
                 6.0, 0.0);

    // x^2 on a fine uniform grid: error is O(h^2)
    const int n = 1001;
    std::vector<double> xu(n), yu(n);
    for (int i = 0; i < n; ++i) {
        xu[i] = i / static_cast<double>(n - 1);
        yu[i] = xu[i] * xu[i];
    }
    requireClose("integral of x^2 on [0,1]", numeric::trapz(xu, yu), 1.0 / 3.0, 1e-6);

    // Moments reuse the same rule
    std::vector<double> ones(n, 1.0);
    requireClose("first moment", numeric::trapzMoment(xu, ones, 1), 0.5, 1e-12);
    requireClose("second moment", numeric::trapzMoment(xu, ones, 2), 1.0 / 3.0, 1e-6);
    requireClose("moment == trapz", numeric::trapzMoment(xu, ones, 2), numeric::trapz(xu, yu), 1e-15);

    // Running integral ends at the full integral
    std::vector<double> cumulative;
    numeric::cumulativeTrapz(x, y, cumulative);
    REQUIRE(cumulative.size() == x.size(), "cumulative size");
    requireClose("cumulative start", cumulative.front(), 0.0, 0.0);
    requireClose("cumulative end", cumulative.back(), numeric::trapz(x, y), 1e-14);
    for (unsigned i = 1; i < cumulative.size(); ++i) {
        REQUIRE(cumulative[i] >= cumulative[i - 1], "cumulative decreases for a positive integrand");
    }

    pass("trapezoidal rule");
}

static void runTrapezoidMisuse() {
    const std::vector<double> x = {0.0, 1.0, 2.0};
    const std::vector<double> y = {1.0, 1.0};
    REQUIRE_THROWS(numeric::trapz(x, y), std::runtime_error, "length mismatch");
    REQUIRE_THROWS(numeric::trapz(std::vector<double>{1.0}, std::vector<double>{1.0}), std::runtime_error,
                   "single point");
    REQUIRE_THROWS(numeric::trapzMoment(x, x, 3), std::runtime_error, "unsupported moment");

    pass("trapezoidal rule rejects bad input");
}

} // namespace

int main() {
    runLogisticBasics();
    runLogisticSaturation();
    runLogisticVector();
    runLogLogistic();
    runTrapezoid();
    runTrapezoidMisuse();

    return 0;
}
