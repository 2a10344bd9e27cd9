// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef CROOKS_MAXIMUM_LIKELIHOOD_H
#define CROOKS_MAXIMUM_LIKELIHOOD_H

#include <cmath>
#include <limits>
#include <vector>

// dlib
#include "dlib/matrix.h"
#include "dlib/optimization.h"

#include "CrooksErrors.h"
#include "Logistic.hpp"


// Maximum-likelihood estimate of Delta_G from forward/backward work pairs
// - Maximizes the same per-sample likelihood that CrooksBayesEstimator folds
//   into its posterior, but over continuous Delta_G instead of a grid
//   - With equal numbers of forward and backward samples, this is Bennett's
//     acceptance ratio (BAR) estimate
// - Minimization uses BFGS implementation from dlib library
// - References
//   - Bennett (J. Comp. Phys. 1976)
//   - Shirts, Bair, Hooker, & Pande (Phys. Rev. Lett. 2003)
//   - Maragakis, Ritort, Bustamante, Karplus, & Crooks (J. Chem. Phys. 2008)
class CrooksMaximumLikelihood
{
 public:
  // dlib types
  using ColumnVector = dlib::matrix<double,0,1>;

  CrooksMaximumLikelihood() = delete;

  // Solves for the optimal Delta_G
  // - The work vectors must outlive this object
  CrooksMaximumLikelihood(
    const std::vector<double>& work_forwards,
    const std::vector<double>& work_backwards,
    const double beta,
    const double tol = 1.0e-7  // solver tolerance
  );

  // Same, with an explicit initial guess
  CrooksMaximumLikelihood(
    const std::vector<double>& work_forwards,
    const std::vector<double>& work_backwards,
    const double beta,
    const double delta_g_guess,
    const double tol
  );


  //----- Objective Function -----//

  // Mean negative log-likelihood:
  //    A(g) = -(1/N) sum_i [ log s(beta*(W_F,i - g)) + log s(beta*(W_B,i + g)) ]
  double evalObjectiveFunction(const ColumnVector& delta_g) const;

  // dA/dg = (beta/N) sum_i [ s(beta*(W_F,i - g)) - s(beta*(W_B,i + g)) ]
  const ColumnVector evalObjectiveDerivatives(const ColumnVector& delta_g) const;


  //----- Results -----//

  double get_delta_g_opt() const noexcept {
    return delta_g_opt_;
  }

  double get_delta_g_guess() const noexcept {
    return delta_g_guess_;
  }

  // Value of the objective function at the solution
  double get_min_A() const noexcept {
    return min_A_;
  }

  // Default initial guess: halfway between the forward and (minus) backward average work
  static double computeInitialGuess(
    const std::vector<double>& work_forwards,
    const std::vector<double>& work_backwards
  );

 private:
  const std::vector<double>& work_forwards_;
  const std::vector<double>& work_backwards_;
  const double beta_;

  // Solver tolerance
  const double tol_ = 1.0e-7;

  int    num_samples_;
  double inv_num_samples_;  // precompute for speed

  double delta_g_guess_;
  double delta_g_opt_;
  double min_A_;

  void checkInput() const;

  double solve(const double delta_g_guess);
};

#endif // ifndef CROOKS_MAXIMUM_LIKELIHOOD_H
