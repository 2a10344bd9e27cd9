// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef CROOKS_BAYES_H
#define CROOKS_BAYES_H

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

#include "CrooksErrors.h"
#include "CrooksLikelihood.h"
#include "HypothesisGrid.h"
#include "Trapezoid.hpp"


// Posterior mean and standard deviation of Delta_G
// - The mean is optimal under the squared-error criterion
struct PosteriorSummary
{
	double mean    = 0.0;
	double std_dev = 0.0;
};


// Sequential Bayesian estimate of a free energy difference from pairs of
// forward/backward work measurements (Crooks-Bayes)
// - Starts from a flat prior over the grid
// - Each call to absorb() multiplies the posterior by the normalized likelihood
//   of one sample pair, renormalizes, and records the posterior mean and
//   standard deviation
// - Samples must be absorbed in order: each update depends on the previous posterior
//
// The object exclusively owns the posterior. It is not copyable, since the
// likelihood holds a reference to the grid it owns.
class CrooksBayesEstimator
{
 public:
	// Polled between samples: return false to stop early
	using KeepGoing = std::function<bool()>;

	CrooksBayesEstimator() = delete;

	CrooksBayesEstimator(
		const HypothesisGrid& grid,
		const double beta  // inverse temperature, in units of 1/[work]
	);

	CrooksBayesEstimator(const CrooksBayesEstimator&) = delete;
	CrooksBayesEstimator& operator=(const CrooksBayesEstimator&) = delete;


	//----- Updates -----//

	// Absorbs a single forward/backward pair and returns the updated summary
	// - If this throws, the posterior and traces are left unchanged
	PosteriorSummary absorb(const double work_f, const double work_b);

	// Absorbs all pairs in order
	// - Throws SampleLengthMismatchError before any update if the lengths differ
	// - Returns the number of pairs absorbed (fewer than given if 'keep_going'
	//   returned false)
	int absorbAll(
		const std::vector<double>& work_forwards,
		const std::vector<double>& work_backwards,
		const KeepGoing& keep_going = nullptr
	);

	// Discards all samples and returns to the flat prior
	void reset();


	//----- Output -----//

	const HypothesisGrid& getGrid() const noexcept {
		return grid_;
	}

	double getBeta() const noexcept {
		return likelihood_.getBeta();
	}

	// Posterior density at each grid point (integrates to 1 over the grid)
	const std::vector<double>& getPosterior() const noexcept {
		return posterior_;
	}

	int getNumSamples() const noexcept {
		return static_cast<int>( mean_trace_.size() );
	}

	// Posterior mean and standard deviation after each sample, in input order
	const std::vector<double>& getMeanTrace() const noexcept {
		return mean_trace_;
	}
	const std::vector<double>& getStdDevTrace() const noexcept {
		return std_dev_trace_;
	}

	// Summary of the current posterior (flat-prior values if no samples were absorbed)
	PosteriorSummary getSummary() const {
		return summarize(grid_.getPoints(), posterior_);
	}

	// Grid point with the largest posterior density
	double computeMode() const;

	// Central credible interval containing the given probability mass (0 < mass < 1)
	// - Bounds are interpolated linearly from the cumulative trapezoid integral
	std::pair<double,double> computeCredibleInterval(const double mass = 0.95) const;

	// Mean and standard deviation of a normalized density sampled on 'delta_g'
	// - The variance is clamped at zero before taking the square root
	static PosteriorSummary summarize(
		const std::vector<double>& delta_g,
		const std::vector<double>& density
	);

 private:
	const HypothesisGrid   grid_;
	const CrooksLikelihood likelihood_;  // refers to grid_

	std::vector<double> posterior_;
	std::vector<double> mean_trace_, std_dev_trace_;

	// Working buffers
	std::vector<double> likelihood_buffer_, posterior_buffer_;

	// Inverse of the cumulative distribution at probability p
	double interpolateQuantile(const std::vector<double>& cumulative, const double p) const;
};


// Results of a complete Crooks-Bayes run
struct CrooksBayesResults
{
	double delta_g_est = 0.0;  // final posterior mean
	double delta_g_err = 0.0;  // final posterior standard deviation

	std::vector<double> delta_g;    // hypothesis grid
	std::vector<double> posterior;  // final posterior over the grid

	std::vector<double> delta_g_est_trace;  // posterior mean after each sample
	std::vector<double> delta_g_err_trace;  // posterior standard deviation after each sample

	int  num_samples = 0;      // number of pairs absorbed
	bool cancelled   = false;  // true if 'keep_going' stopped the run early
};


namespace CrooksBayes
{

// Runs the full sequential estimate
// - Throws InvalidInputError for an empty sample set or non-finite beta,
//   SampleLengthMismatchError for unequal lengths, InvalidRangeError for a bad
//   grid, and DegenerateLikelihoodError if an update cannot be normalized
CrooksBayesResults estimate(
	const std::vector<double>& work_forwards,
	const std::vector<double>& work_backwards,
	const double beta,
	const double delta_g_min,
	const double delta_g_max,
	const double step = HypothesisGrid::DEFAULT_STEP,
	const CrooksBayesEstimator::KeepGoing& keep_going = nullptr
);

} // end namespace CrooksBayes

#endif // ifndef CROOKS_BAYES_H
