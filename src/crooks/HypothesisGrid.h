// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#ifndef HYPOTHESIS_GRID_H
#define HYPOTHESIS_GRID_H

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

#include "CrooksErrors.h"


// Ordered set of hypotheses for the free energy difference, Delta_G
// - Points are evenly spaced over the closed interval [min, max]: both
//   endpoints are included
// - Number of points: floor((max - min)/step)
//   - The actual spacing is therefore (max - min)/(num_points - 1), which is
//     generally a little larger than the nominal step
// - Immutable after construction
class HypothesisGrid
{
 public:
	// Typedefs
	using VectorReal     = std::vector<double>;
	using const_iterator = typename VectorReal::const_iterator;

	static constexpr double DEFAULT_STEP = 0.1;

	// Throws InvalidRangeError if max <= min, if the step is not positive,
	// or if the step yields fewer than 2 points
	HypothesisGrid(
		const double min,
		const double max,
		const double step = DEFAULT_STEP
	);


	//----- Settings -----//

	// Returns the number of grid points
	std::size_t size() const noexcept {
		return points_.size();
	}

	int getNumPoints() const noexcept {
		return static_cast<int>( points_.size() );
	}

	double getMin() const noexcept {
		return min_;
	}

	double getMax() const noexcept {
		return max_;
	}

	// Nominal step requested by the user
	double getStep() const noexcept {
		return step_;
	}

	// Spacing between neighboring points
	double getSpacing() const noexcept {
		return spacing_;
	}

	// Returns the range of values spanned by the grid
	double getSpan() const noexcept {
		return max_ - min_;
	}

	double getMidpoint() const noexcept {
		return 0.5*(min_ + max_);
	}


	//----- Access values ----//

	const_iterator begin() const noexcept {
		return points_.begin();
	}

	const_iterator end() const noexcept {
		return points_.end();
	}

	// Returns the location of the 'i'th point
	const double& operator[](const int i) const {
		return points_[i];
	}

	const VectorReal& getPoints() const noexcept {
		return points_;
	}


	//----- Helpers -----//

	// Number of points a range/step pair produces (0 if the ratio is not finite)
	static int countPoints(const double min, const double max, const double step);

 private:
	double min_, max_, step_, spacing_;

	VectorReal points_;
};

#endif /* HYPOTHESIS_GRID_H */
