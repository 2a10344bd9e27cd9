// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#ifndef BOOTSTRAP_DELTA_G_HPP
#define BOOTSTRAP_DELTA_G_HPP

#include <vector>

#include "WorkResampler.h"
#include "CrooksMaximumLikelihood.h"
#include "Statistics.h"

// Bootstrap error estimate for the maximum-likelihood Delta_G
// - Forward and backward work are resampled independently (with replacement),
//   and the maximum-likelihood equations are re-solved for each resample
class Bootstrap_DeltaG
{
 public:
  Bootstrap_DeltaG(
    const int num_bootstrap_samples,
    const std::vector<int>& seeds
  );

  // Generates all resamples, then solves for each one
  // - The optimal Delta_G of the full data set makes a good initial guess
  void calculate(
    const std::vector<double>& work_forwards,
    const std::vector<double>& work_backwards,
    const double beta,
    const double delta_g_guess,
    const double tol
  );

  int getNumBootstrapSamples() const noexcept {
    return num_bootstrap_samples_;
  }

  // Estimates of Delta_G, one per resample
  const std::vector<double>& getSamples() const noexcept {
    return samples_;
  }

  double average() const {
    return Statistics::average(samples_);
  }

  // Bootstrap error (sample standard deviation of the resampled estimates)
  double std_dev() const {
    return Statistics::std_dev(samples_, 1);
  }

  // Bootstrap error using only the first n = 2, 3, ... resamples
  // - Element [n-2] corresponds to n resamples
  std::vector<double> computeConvergence() const;

 private:
  int num_bootstrap_samples_;
  std::vector<int> seeds_;

  std::vector<double> samples_;
};

#endif // ifndef BOOTSTRAP_DELTA_G_HPP
