#include "HypothesisGrid.h"

#include <sstream>

constexpr double HypothesisGrid::DEFAULT_STEP;


HypothesisGrid::HypothesisGrid(const double min, const double max, const double step):
	min_(min), max_(max), step_(step), spacing_(0.0)
{
	// Check input
	if ( not (std::isfinite(min) and std::isfinite(max)) ) {
		throw InvalidRangeError("the bounds of the hypothesis range must be finite");
	}
	else if ( max <= min ) {
		std::stringstream ss;
		ss << "delta_g_max (" << max << ") must be greater than delta_g_min (" << min << ")";
		throw InvalidRangeError( ss.str() );
	}
	else if ( not (std::isfinite(step) and step > 0.0) ) {
		std::stringstream ss;
		ss << "the step size must be positive and finite (got " << step << ")";
		throw InvalidRangeError( ss.str() );
	}

	const int num_points = countPoints(min_, max_, step_);
	if ( num_points < 2 ) {
		std::stringstream ss;
		ss << "step " << step_ << " over [" << min_ << ", " << max_ << "] yields " << num_points
		   << " point(s), but at least 2 are needed for integration";
		throw InvalidRangeError( ss.str() );
	}

	// Evenly spaced, endpoints included
	// - Compute each point directly from its index to avoid accumulating round-off
	points_.resize(num_points);
	spacing_ = (max_ - min_)/static_cast<double>(num_points - 1);
	for ( int i=0; i<num_points; ++i ) {
		points_[i] = min_ + i*spacing_;
	}
	points_.back() = max_;
}


int HypothesisGrid::countPoints(const double min, const double max, const double step)
{
	// The relative tolerance keeps ratios like 20/0.1 from flooring to one fewer point
	const double ratio = (max - min)/step;
	if ( not std::isfinite(ratio) or ratio < 0.0 ) {
		return 0;
	}
	const double max_points = 1.0e9;
	if ( ratio >= max_points ) {
		throw InvalidRangeError("the step size is too small for the hypothesis range");
	}
	return static_cast<int>( std::floor(ratio*(1.0 + 1.0e-9)) );
}

