// AUTHOR: Sean M. Marks (https://github.com/seanmarks)
#include "CrooksBayes.h"

#include <sstream>


CrooksBayesEstimator::CrooksBayesEstimator(const HypothesisGrid& grid, const double beta):
	grid_(grid),
	likelihood_(grid_, beta)
{
	reset();
}


void CrooksBayesEstimator::reset()
{
	// Flat prior, normalized over the grid
	posterior_.assign( grid_.size(), 1.0/grid_.getSpan() );

	mean_trace_.clear();
	std_dev_trace_.clear();
}


PosteriorSummary CrooksBayesEstimator::absorb(const double work_f, const double work_b)
{
	// Likelihood of this sample (normalized on its own)
	likelihood_.compute(work_f, work_b, likelihood_buffer_);

	// Posterior probability
	const auto& delta_g  = grid_.getPoints();
	const int num_points = delta_g.size();
	posterior_buffer_.resize(num_points);
	for ( int i=0; i<num_points; ++i ) {
		posterior_buffer_[i] = likelihood_buffer_[i]*posterior_[i];
	}

	// Normalized at every step to avoid numerical errors
	const double norm = numeric::trapz(delta_g, posterior_buffer_);
	if ( not (std::isfinite(norm) and norm > 0.0) ) {
		std::stringstream ss;
		ss << "posterior vanished after sample " << getNumSamples() + 1
		   << " (W_F = " << work_f << ", W_B = " << work_b << "): integral = " << norm;
		throw DegenerateLikelihoodError( ss.str() );
	}
	for ( int i=0; i<num_points; ++i ) {
		posterior_buffer_[i] /= norm;
	}

	// Commit
	posterior_.swap(posterior_buffer_);

	PosteriorSummary summary = summarize(delta_g, posterior_);
	mean_trace_.push_back( summary.mean );
	std_dev_trace_.push_back( summary.std_dev );

	return summary;
}


int CrooksBayesEstimator::absorbAll(
	const std::vector<double>& work_forwards, const std::vector<double>& work_backwards,
	const KeepGoing& keep_going)
{
	if ( work_forwards.size() != work_backwards.size() ) {
		throw SampleLengthMismatchError( work_forwards.size(), work_backwards.size() );
	}

	const int num_samples = work_forwards.size();
	mean_trace_.reserve( mean_trace_.size() + num_samples );
	std_dev_trace_.reserve( std_dev_trace_.size() + num_samples );

	for ( int x=0; x<num_samples; ++x ) {
		if ( keep_going and (not keep_going()) ) {
			return x;
		}
		absorb( work_forwards[x], work_backwards[x] );
	}

	return num_samples;
}


PosteriorSummary CrooksBayesEstimator::summarize(
	const std::vector<double>& delta_g, const std::vector<double>& density)
{
	PosteriorSummary summary;

	// Estimate (posterior mean)
	summary.mean = numeric::trapzMoment(delta_g, density, 1);

	// Uncertainty (measurement-dependent mean square error)
	// - Cancellation can leave a tiny negative variance once the posterior has
	//   collapsed onto a few grid points
	const double second_moment = numeric::trapzMoment(delta_g, density, 2);
	const double var = std::max( second_moment - summary.mean*summary.mean, 0.0 );
	summary.std_dev = std::sqrt(var);

	return summary;
}


double CrooksBayesEstimator::computeMode() const
{
	auto it = std::max_element( posterior_.begin(), posterior_.end() );
	return grid_[ static_cast<int>( std::distance(posterior_.begin(), it) ) ];
}


std::pair<double,double> CrooksBayesEstimator::computeCredibleInterval(const double mass) const
{
	CROOKS_ASSERT( mass > 0.0 and mass < 1.0, "probability mass must be in (0,1), got " << mass );

	std::vector<double> cumulative;
	numeric::cumulativeTrapz(grid_.getPoints(), posterior_, cumulative);

	const double tail = 0.5*(1.0 - mass);
	return std::make_pair( interpolateQuantile(cumulative, tail),
	                       interpolateQuantile(cumulative, 1.0 - tail) );
}


double CrooksBayesEstimator::interpolateQuantile(const std::vector<double>& cumulative, const double p) const
{
	// Scale by the total in case round-off left it slightly away from 1
	const double target = p*cumulative.back();

	auto it = std::lower_bound( cumulative.begin(), cumulative.end(), target );
	if ( it == cumulative.begin() ) {
		return grid_.getMin();
	}
	else if ( it == cumulative.end() ) {
		return grid_.getMax();
	}

	const int i = static_cast<int>( std::distance(cumulative.begin(), it) );
	const double c_left  = cumulative[i-1];
	const double c_right = cumulative[i];
	if ( c_right <= c_left ) {
		return grid_[i];
	}
	const double frac = (target - c_left)/(c_right - c_left);
	return grid_[i-1] + frac*(grid_[i] - grid_[i-1]);
}


namespace CrooksBayes
{

CrooksBayesResults estimate(
	const std::vector<double>& work_forwards, const std::vector<double>& work_backwards,
	const double beta, const double delta_g_min, const double delta_g_max, const double step,
	const CrooksBayesEstimator::KeepGoing& keep_going)
{
	// Check all preconditions before doing any work
	if ( work_forwards.size() != work_backwards.size() ) {
		throw SampleLengthMismatchError( work_forwards.size(), work_backwards.size() );
	}
	if ( work_forwards.empty() ) {
		throw InvalidInputError("at least one forward/backward pair is needed");
	}

	HypothesisGrid grid(delta_g_min, delta_g_max, step);
	CrooksBayesEstimator estimator(grid, beta);

	CrooksBayesResults results;
	results.num_samples = estimator.absorbAll(work_forwards, work_backwards, keep_going);
	results.cancelled   = ( results.num_samples < static_cast<int>(work_forwards.size()) );

	const PosteriorSummary summary = estimator.getSummary();
	results.delta_g_est = summary.mean;
	results.delta_g_err = summary.std_dev;

	results.delta_g           = grid.getPoints();
	results.posterior         = estimator.getPosterior();
	results.delta_g_est_trace = estimator.getMeanTrace();
	results.delta_g_err_trace = estimator.getStdDevTrace();

	return results;
}

} // end namespace CrooksBayes
