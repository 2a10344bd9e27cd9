// AUTHOR: Sean M. Marks (https://github.com/seanmarks)
#include "CrooksLikelihood.h"

#include <sstream>


CrooksLikelihood::CrooksLikelihood(const HypothesisGrid& grid, const double beta):
	grid_(grid),
	beta_(beta)
{
	if ( not std::isfinite(beta_) ) {
		throw InvalidInputError("beta must be finite");
	}
}


void CrooksLikelihood::compute(
	const double work_f, const double work_b,
	std::vector<double>& likelihood
) const
{
	if ( std::isnan(work_f) or std::isnan(work_b) ) {
		throw InvalidInputError("work values must not be NaN");
	}

	const auto& delta_g = grid_.getPoints();
	const int num_points = delta_g.size();
	likelihood.resize(num_points);

	#pragma omp simd
	for ( int i=0; i<num_points; ++i ) {
		const double exponent_f = beta_*(work_f - delta_g[i]);
		const double exponent_b = beta_*(work_b + delta_g[i]);
		likelihood[i] = numeric::logistic(exponent_f)*numeric::logistic(exponent_b);
	}

	// Normalize to avoid numerical errors downstream
	const double norm = numeric::trapz(delta_g, likelihood);
	if ( not (std::isfinite(norm) and norm > 0.0) ) {
		std::stringstream ss;
		ss << "sample (W_F = " << work_f << ", W_B = " << work_b << ", beta = " << beta_ << ") "
		   << "has likelihood integral " << norm << " over [" << grid_.getMin() << ", " << grid_.getMax() << "]";
		throw DegenerateLikelihoodError( ss.str() );
	}

	for ( int i=0; i<num_points; ++i ) {
		likelihood[i] /= norm;
	}
}
