// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef CROOKS_LIKELIHOOD_H
#define CROOKS_LIKELIHOOD_H

#include <cmath>
#include <vector>

#include "CrooksErrors.h"
#include "HypothesisGrid.h"
#include "Logistic.hpp"
#include "Trapezoid.hpp"


// Likelihood of a single forward/backward work pair as a function of the
// free energy difference, evaluated over a HypothesisGrid
//
// For each hypothesis g:
//   exponent_f = beta*(W_F - g)
//   exponent_b = beta*(W_B + g)
//   L(g) = s(exponent_f) * s(exponent_b),   s(z) = 1/(1 + exp(z))
//
// The result is normalized to integrate to 1 over the grid.
//
// - Reference: Maragakis, Ritort, Bustamante, Karplus, & Crooks (J. Chem. Phys. 2008)
// - Work is in the same energy units as 1/beta
class CrooksLikelihood
{
 public:
	CrooksLikelihood(
		const HypothesisGrid& grid,  // must outlive this object
		const double beta            // inverse temperature
	);

	// Computes the normalized likelihood for one sample pair
	// - Throws DegenerateLikelihoodError if the integral of the raw likelihood
	//   over the grid is zero or non-finite
	void compute(
		const double work_f,
		const double work_b,
		// Output
		std::vector<double>& likelihood
	) const;

	std::vector<double> compute(const double work_f, const double work_b) const {
		std::vector<double> likelihood;
		compute(work_f, work_b, likelihood);
		return likelihood;
	}

	double getBeta() const noexcept {
		return beta_;
	}

	const HypothesisGrid& getGrid() const noexcept {
		return grid_;
	}

 private:
	const HypothesisGrid& grid_;
	const double beta_;
};

#endif // ifndef CROOKS_LIKELIHOOD_H
