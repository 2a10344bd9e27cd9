#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <vector>

#include "HypothesisGrid.h"
#include "TestHelpers.h"

namespace {

static void runReferenceGrid() {
    HypothesisGrid grid(-10.0, 10.0, 0.1);

    REQUIRE(grid.size() == 200, "expected floor(20/0.1) = 200 points, got " << grid.size());
    REQUIRE(grid.getNumPoints() == 200, "getNumPoints disagrees with size");
    requireClose("first point", grid[0], -10.0, 0.0);
    requireClose("last point", grid[199], 10.0, 0.0);
    requireClose("spacing", grid.getSpacing(), 20.0 / 199.0, 1e-14);
    requireClose("nominal step", grid.getStep(), 0.1, 0.0);
    requireClose("span", grid.getSpan(), 20.0, 0.0);
    requireClose("midpoint", grid.getMidpoint(), 0.0, 0.0);

    for (int i = 1; i < grid.getNumPoints(); ++i) {
        REQUIRE(grid[i] > grid[i - 1], "grid not strictly increasing at " << i);
        requireClose("uniform spacing", grid[i] - grid[i - 1], grid.getSpacing(), 1e-12);
    }

    // Iterators and the underlying vector agree
    const std::vector<double>& points = grid.getPoints();
    int i = 0;
    for (double g : grid) {
        REQUIRE(g == points[i], "iterator mismatch at " << i);
        ++i;
    }
    REQUIRE(i == 200, "iterated over " << i << " points");

    pass("reference grid [-10, 10], step 0.1");
}

static void runDefaultStep() {
    HypothesisGrid grid(0.0, 1.0);
    requireClose("default step", grid.getStep(), HypothesisGrid::DEFAULT_STEP, 0.0);
    REQUIRE(grid.size() == 10, "expected 10 points with the default step, got " << grid.size());
    pass("default step");
}

static void runRoundOffInPointCount() {
    // 0.3/0.1 = 2.9999999999999996 in double precision
    HypothesisGrid grid(0.0, 0.3, 0.1);
    REQUIRE(grid.size() == 3, "expected 3 points, got " << grid.size());

    HypothesisGrid two(0.0, 1.0, 0.5);
    REQUIRE(two.size() == 2, "expected 2 points, got " << two.size());
    requireClose("two-point grid lower", two[0], 0.0, 0.0);
    requireClose("two-point grid upper", two[1], 1.0, 0.0);

    REQUIRE(HypothesisGrid::countPoints(-1.0, 1.0, 0.25) == 8, "countPoints(-1, 1, 0.25)");
    REQUIRE(HypothesisGrid::countPoints(0.0, 1.0, std::numeric_limits<double>::quiet_NaN()) == 0,
            "countPoints with NaN step");

    pass("point count is robust to round-off");
}

static void runInvalidRanges() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE_THROWS(HypothesisGrid(1.0, 1.0, 0.1), InvalidRangeError, "max == min");
    REQUIRE_THROWS(HypothesisGrid(2.0, 1.0, 0.1), InvalidRangeError, "max < min");
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, 0.0), InvalidRangeError, "zero step");
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, -0.1), InvalidRangeError, "negative step");
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, nan), InvalidRangeError, "NaN step");
    REQUIRE_THROWS(HypothesisGrid(nan, 1.0, 0.1), InvalidRangeError, "NaN min");
    REQUIRE_THROWS(HypothesisGrid(0.0, inf, 0.1), InvalidRangeError, "infinite max");

    // Steps that leave fewer than 2 points
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, 0.6), InvalidRangeError, "one point");
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, 5.0), InvalidRangeError, "zero points");

    // Steps so small that the grid could never be allocated
    REQUIRE_THROWS(HypothesisGrid(0.0, 1.0, 1.0e-12), InvalidRangeError, "step too small");

    pass("invalid ranges are rejected");
}

} // namespace

int main() {
    runReferenceGrid();
    runDefaultStep();
    runRoundOffInPointCount();
    runInvalidRanges();

    return 0;
}
