// AUTHOR: Sean M. Marks (https://github.com/seanmarks)
#include "CrooksBayesDriver.h"

#include <memory>

#include <omp.h>


CrooksBayesDriver::CrooksBayesDriver(const std::string& options_file):
	options_file_(options_file),
	input_options_(options_file)
{
	setup_timer_.start();

	using KeyType = InputOptions::KeyType;
	bool found = false;

	input_options_.readFlag("be_verbose", KeyType::Optional, be_verbose_);
	input_options_.readFlag("be_quiet",   KeyType::Optional, be_quiet_);
	if ( be_quiet_ ) {
		be_verbose_ = false;
	}

	if ( ! be_quiet_ ) {
		std::cout << "CROOKS-BAYES\n"
		          << "  Using " << omp_get_max_threads() << " threads (max.)\n" << std::flush;
	}

	// Inverse temperature: given directly, or from the temperature (in K)
	const bool has_beta = input_options_.hasKey("Beta");
	const bool has_temp = input_options_.hasKey("Temperature");
	if ( has_beta and has_temp ) {
		throw std::runtime_error(options_file_ + ": give either \"Beta\" or \"Temperature\", not both");
	}
	else if ( has_beta ) {
		input_options_.readNumber("Beta", KeyType::Required, crooks_options_.beta);
	}
	else if ( has_temp ) {
		double temperature = 0.0;
		input_options_.readNumber("Temperature", KeyType::Required, temperature);
		if ( not (temperature > 0.0) ) {
			throw std::runtime_error(options_file_ + ": the temperature must be positive");
		}
		crooks_options_.beta = Constants::inverseTemperature(temperature);
	}
	else {
		throw std::runtime_error(options_file_ + ": missing required key \"Beta\" (or \"Temperature\")");
	}

	// Hypothesis range
	input_options_.readNumber("DeltaG_Min",  KeyType::Required, crooks_options_.delta_g_min);
	input_options_.readNumber("DeltaG_Max",  KeyType::Required, crooks_options_.delta_g_max);
	input_options_.readNumber("DeltaG_Step", KeyType::Optional, crooks_options_.step);

	input_options_.readNumber("SolverTolerance", KeyType::Optional, crooks_options_.tol);

	// Load work data
	// - Relative paths are with respect to the location of the options file
	const std::string options_path = FileSystem::dirname(options_file_);
	std::string work_f_file, work_b_file;
	input_options_.readString("WorkForwardFile",  KeyType::Required, work_f_file);
	input_options_.readString("WorkBackwardFile", KeyType::Required, work_b_file);
	input_options_.readNumber("WorkColumn",       KeyType::Optional, crooks_options_.col);

	if ( ! be_quiet_ ) {
		std::cout << "  Loading data ...\n" << std::flush;
	}
	work_forwards_  = WorkSeries( FileSystem::resolveRelativePath(work_f_file, options_path), crooks_options_.col );
	work_backwards_ = WorkSeries( FileSystem::resolveRelativePath(work_b_file, options_path), crooks_options_.col );

	const int num_f = work_forwards_.size();
	const int num_b = work_backwards_.size();
	if ( num_f != num_b ) {
		throw SampleLengthMismatchError(num_f, num_b);
	}
	if ( num_f == 0 ) {
		throw InvalidInputError("no work samples found in " + work_forwards_.get_file());
	}

	// Bootstrap error estimation (optional)
	found = input_options_.readNumber("num_bootstrap_samples", KeyType::Optional, num_bootstrap_samples_);
	if ( found ) {
		error_method_ = ErrorMethod::Bootstrap;
	}
	input_options_.readFlag("reproducible_bootstrap", KeyType::Optional, use_debug_seeds_);

	if ( be_verbose_ ) {
		std::cout << "  beta = " << crooks_options_.beta << "\n"
		          << "  Delta_G range: [" << crooks_options_.delta_g_min << ", "
		          << crooks_options_.delta_g_max << "], step " << crooks_options_.step << "\n"
		          << "  " << num_f << " forward/backward pairs\n"
		          << "    forward:  " << work_forwards_.get_file()  << "  (avg = " << work_forwards_.average()  << ")\n"
		          << "    backward: " << work_backwards_.get_file() << "  (avg = " << work_backwards_.average() << ")\n"
		          << std::flush;
	}

	setup_timer_.stop();
}


void CrooksBayesDriver::run_driver()
{
	driver_timer_.start();

	//----- Crooks-Bayes -----//

	if ( ! be_quiet_ ) {
		std::cout << "  Updating posterior ...\n" << std::flush;
	}

	bayes_timer_.start();
	HypothesisGrid grid( crooks_options_.delta_g_min, crooks_options_.delta_g_max, crooks_options_.step );
	CrooksBayesEstimator estimator( grid, crooks_options_.beta );
	estimator.absorbAll( work_forwards_.get_data(), work_backwards_.get_data() );
	bayes_timer_.stop();

	const PosteriorSummary summary = estimator.getSummary();
	if ( ! be_quiet_ ) {
		std::cout << "  Done\n"
		          << "  Delta_G (posterior mean) = " << summary.mean << " +/- " << summary.std_dev << "\n"
		          << std::flush;
	}


	//----- Maximum likelihood -----//

	mle_timer_.start();
	CrooksMaximumLikelihood mle( work_forwards_.get_data(), work_backwards_.get_data(),
	                             crooks_options_.beta, crooks_options_.tol );
	mle_timer_.stop();

	if ( ! be_quiet_ ) {
		std::cout << "  Delta_G (maximum likelihood) = " << mle.get_delta_g_opt()
		          << "  (initial: " << mle.get_delta_g_guess() << ")\n" << std::flush;
	}

	std::unique_ptr<Bootstrap_DeltaG> bootstrap_ptr;
	if ( error_method_ == ErrorMethod::Bootstrap ) {
		bootstrap_timer_.start();

		if ( ! be_quiet_ ) {
			std::cout << "  Estimate errors using bootstrap subsampling ("
			          << num_bootstrap_samples_ << " samples) ...\n" << std::flush;
		}

		bootstrap_ptr.reset( new Bootstrap_DeltaG( num_bootstrap_samples_, Random::getSeeds(use_debug_seeds_) ) );
		bootstrap_ptr->calculate( work_forwards_.get_data(), work_backwards_.get_data(),
		                          crooks_options_.beta, mle.get_delta_g_opt(), crooks_options_.tol );

		if ( ! be_quiet_ ) {
			std::cout << "  Bootstrap error = " << bootstrap_ptr->std_dev() << "\n" << std::flush;
		}

		bootstrap_timer_.stop();
	}


	//----- Output -----//

	print_output_timer_.start();

	printSummary(estimator, mle, bootstrap_ptr.get());
	printConvergence(estimator);
	printPosterior(estimator);
	if ( bootstrap_ptr ) {
		printBootstrapConvergence(*bootstrap_ptr);
	}

	print_output_timer_.stop();

	driver_timer_.stop();
}


void CrooksBayesDriver::printSummary(
	const CrooksBayesEstimator& estimator, const CrooksMaximumLikelihood& mle,
	const Bootstrap_DeltaG* bootstrap_ptr, std::string file_name) const
{
	if ( file_name.empty() ) {
		file_name = "delta_g_crooks_bayes.out";
	}
	std::ofstream ofs(file_name);
	if ( not ofs ) {
		throw std::runtime_error("unable to open output file " + file_name);
	}

	const PosteriorSummary summary = estimator.getSummary();
	const auto interval = estimator.computeCredibleInterval(0.95);

	ofs << "# Free energy difference estimates\n"
	    << "#   beta = " << crooks_options_.beta << "\n"
	    << "#   num_samples = " << estimator.getNumSamples() << "\n"
	    << std::setprecision(7)
	    << "posterior_mean      " << summary.mean << "\n"
	    << "posterior_std_dev   " << summary.std_dev << "\n"
	    << "posterior_mode      " << estimator.computeMode() << "\n"
	    << "credible_95_lower   " << interval.first  << "\n"
	    << "credible_95_upper   " << interval.second << "\n"
	    << "max_likelihood      " << mle.get_delta_g_opt() << "\n";
	if ( bootstrap_ptr != nullptr ) {
		ofs << "max_likelihood_err  " << bootstrap_ptr->std_dev() << "\n";
	}
	ofs.close();
}


void CrooksBayesDriver::printConvergence(const CrooksBayesEstimator& estimator, std::string file_name) const
{
	if ( file_name.empty() ) {
		file_name = "convergence_crooks_bayes.out";
	}
	std::ofstream ofs(file_name);
	if ( not ofs ) {
		throw std::runtime_error("unable to open output file " + file_name);
	}

	const auto& mean_trace    = estimator.getMeanTrace();
	const auto& std_dev_trace = estimator.getStdDevTrace();

	ofs << "# Convergence of the Crooks-Bayes estimate\n"
	    << "# num_samples  Delta_G_est  Delta_G_err\n";
	const int num_samples = mean_trace.size();
	for ( int x=0; x<num_samples; ++x ) {
		ofs << x+1 << "  " << std::setprecision(7) << mean_trace[x]
		    << "  " << std::setprecision(7) << std_dev_trace[x] << "\n";
	}
	ofs.close();
}


void CrooksBayesDriver::printPosterior(const CrooksBayesEstimator& estimator, std::string file_name) const
{
	if ( file_name.empty() ) {
		file_name = "posterior_crooks_bayes.out";
	}
	std::ofstream ofs(file_name);
	if ( not ofs ) {
		throw std::runtime_error("unable to open output file " + file_name);
	}

	const auto& grid      = estimator.getGrid();
	const auto& posterior = estimator.getPosterior();

	ofs << "# Posterior probability density of Delta_G after "
	    << estimator.getNumSamples() << " samples\n"
	    << "# Delta_G  P(Delta_G)\n";
	const int num_points = grid.getNumPoints();
	for ( int i=0; i<num_points; ++i ) {
		ofs << std::setprecision(7) << grid[i] << "  " << std::setprecision(7) << posterior[i] << "\n";
	}
	ofs.close();
}


void CrooksBayesDriver::printBootstrapConvergence(const Bootstrap_DeltaG& bootstrap, std::string file_name) const
{
	if ( file_name.empty() ) {
		file_name = "bootstrap_convergence.out";
	}
	std::ofstream ofs(file_name);
	if ( not ofs ) {
		throw std::runtime_error("unable to open output file " + file_name);
	}

	ofs << "# Convergence of bootstrap subsampling\n"
	    << "# n_B[samples]  err(Delta_G_ML)\n";

	const auto convergence = bootstrap.computeConvergence();
	const int num_values = convergence.size();
	for ( int n=0; n<num_values; ++n ) {
		ofs << n+2 << "  " << std::setprecision(7) << convergence[n] << "\n";
	}
	ofs.close();
}
