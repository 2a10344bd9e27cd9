// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef CROOKS_BAYES_DRIVER_H
#define CROOKS_BAYES_DRIVER_H

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// Project headers
#include "Bootstrap_DeltaG.hpp"
#include "Constants.h"
#include "CrooksBayes.h"
#include "CrooksMaximumLikelihood.h"
#include "FileSystem.h"
#include "HypothesisGrid.h"
#include "InputOptions.h"
#include "Random.h"
#include "Timer.h"
#include "WorkSeries.h"


// Estimates a free energy difference from forward/backward work measurements
// - Crooks-Bayes sequential posterior (mean and standard deviation after each sample)
// - Maximum-likelihood (BAR) estimate, with optional bootstrap errors
//
// NOTES:
// - Work and Delta_G share the same energy units, and beta is their inverse
//   - If 'Temperature' is given instead of 'Beta', energies are in kJ/mol
class CrooksBayesDriver
{
 public:
	CrooksBayesDriver(
		const std::string& options_file
	);

	struct CrooksOptions
	{
		CrooksOptions():
			beta(0.0), delta_g_min(0.0), delta_g_max(0.0), step(HypothesisGrid::DEFAULT_STEP), tol(1.0e-7), col(0)
		{};

		double beta;          // inverse temperature
		double delta_g_min;   // hypothesis range
		double delta_g_max;
		double step;          // nominal grid spacing
		double tol;           // tolerance for the maximum-likelihood solver
		int    col;           // column of the work files holding the data
	};

	// Driver: runs the estimators and prints output
	void run_driver();

	const CrooksOptions& getOptions() const noexcept {
		return crooks_options_;
	}

 private:
	// Input file
	std::string options_file_;
	InputOptions input_options_;

	CrooksBayesDriver::CrooksOptions crooks_options_;

	// Work measurements
	WorkSeries work_forwards_, work_backwards_;

	// Error estimation for the maximum-likelihood estimate
	enum class ErrorMethod { None, Bootstrap };
	ErrorMethod error_method_ = ErrorMethod::None;
	int  num_bootstrap_samples_ = 100;
	bool use_debug_seeds_ = true;


	//----- Output -----//

	bool be_verbose_ = false;  // extra feedback
	bool be_quiet_   = false;  // minimal/no feedback

	void printConvergence(const CrooksBayesEstimator& estimator, std::string file_name = "") const;
	void printPosterior(const CrooksBayesEstimator& estimator, std::string file_name = "") const;
	void printSummary(
		const CrooksBayesEstimator& estimator,
		const CrooksMaximumLikelihood& mle,
		const Bootstrap_DeltaG* bootstrap_ptr,
		std::string file_name = ""
	) const;
	void printBootstrapConvergence(const Bootstrap_DeltaG& bootstrap, std::string file_name = "") const;


	//----- GPTL -----//

	// GPTL must already be initialized (see GptlSession)
	mutable Timer setup_timer_     = Timer("setup");
	mutable Timer driver_timer_    = Timer("driver");
	mutable Timer bayes_timer_     = Timer("crooks_bayes");
	mutable Timer mle_timer_       = Timer("maximum_likelihood");
	mutable Timer bootstrap_timer_ = Timer("bootstrap");

	mutable Timer print_output_timer_ = Timer("print_output");
};

#endif // ifndef CROOKS_BAYES_DRIVER_H
