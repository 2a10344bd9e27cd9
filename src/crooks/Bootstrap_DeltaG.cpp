// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#include "Bootstrap_DeltaG.hpp"

#include <exception>


Bootstrap_DeltaG::Bootstrap_DeltaG(const int num_bootstrap_samples, const std::vector<int>& seeds):
  num_bootstrap_samples_(num_bootstrap_samples),
  seeds_(seeds)
{
  CROOKS_ASSERT( num_bootstrap_samples_ >= 2,
                 "need at least 2 bootstrap samples, got " << num_bootstrap_samples_ );
}


void Bootstrap_DeltaG::calculate(
  const std::vector<double>& work_forwards, const std::vector<double>& work_backwards,
  const double beta, const double delta_g_guess, const double tol)
{
  if ( work_forwards.size() != work_backwards.size() ) {
    throw SampleLengthMismatchError( work_forwards.size(), work_backwards.size() );
  }
  const int num_samples = work_forwards.size();
  if ( num_samples == 0 ) {
    throw InvalidInputError("cannot bootstrap an empty data set");
  }

  // Draw all resamples up front so the sequence of random numbers (and thus
  // the result) does not depend on the number of threads
  // - The backward resampler gets a shifted seed sequence so the two
  //   directions are not resampled identically
  std::vector<int> seeds_b = seeds_;
  seeds_b.push_back( static_cast<int>(seeds_.size()) );
  WorkResampler resampler_f(num_samples, seeds_);
  WorkResampler resampler_b(num_samples, seeds_b);

  std::vector<std::vector<double>> resampled_f(num_bootstrap_samples_), resampled_b(num_bootstrap_samples_);
  for ( int s=0; s<num_bootstrap_samples_; ++s ) {
    resampler_f.draw( work_forwards,  resampled_f[s] );
    resampler_b.draw( work_backwards, resampled_b[s] );
  }

  // Re-solve
  // - Exceptions may not leave an OpenMP region: hold on to the first one
  //   and rethrow it afterward
  samples_.assign(num_bootstrap_samples_, 0.0);
  std::exception_ptr error_ptr = nullptr;
  #pragma omp parallel for schedule(dynamic)
  for ( int s=0; s<num_bootstrap_samples_; ++s ) {
    try {
      CrooksMaximumLikelihood mle( resampled_f[s], resampled_b[s], beta, delta_g_guess, tol );
      samples_[s] = mle.get_delta_g_opt();
    }
    catch (...) {
      #pragma omp critical
      {
        if ( error_ptr == nullptr ) {
          error_ptr = std::current_exception();
        }
      }
    }
  }
  if ( error_ptr != nullptr ) {
    std::rethrow_exception(error_ptr);
  }
}


std::vector<double> Bootstrap_DeltaG::computeConvergence() const
{
  const int num_computed = samples_.size();
  std::vector<double> convergence;
  if ( num_computed < 2 ) {
    return convergence;
  }
  convergence.reserve(num_computed - 1);

  std::vector<double> subset(1, samples_[0]);
  for ( int s=1; s<num_computed; ++s ) {
    subset.push_back( samples_[s] );
    convergence.push_back( Statistics::std_dev(subset, 1) );
  }

  return convergence;
}
