// AUTHOR: Sean M. Marks (https://github.com/seanmarks)
#include "CrooksMaximumLikelihood.h"

#include "CrooksDlibWrappers.h"


CrooksMaximumLikelihood::CrooksMaximumLikelihood(
	const std::vector<double>& work_forwards, const std::vector<double>& work_backwards,
	const double beta, const double tol
):
	CrooksMaximumLikelihood( work_forwards, work_backwards, beta,
	                         computeInitialGuess(work_forwards, work_backwards), tol )
{
}


CrooksMaximumLikelihood::CrooksMaximumLikelihood(
	const std::vector<double>& work_forwards, const std::vector<double>& work_backwards,
	const double beta, const double delta_g_guess, const double tol
):
	work_forwards_(work_forwards),
	work_backwards_(work_backwards),
	beta_(beta),
	tol_(tol),
	num_samples_( work_forwards.size() ),
	inv_num_samples_(0.0),
	delta_g_guess_(delta_g_guess),
	delta_g_opt_(delta_g_guess),
	min_A_(0.0)
{
	checkInput();
	inv_num_samples_ = 1.0/static_cast<double>(num_samples_);

	delta_g_opt_ = solve(delta_g_guess_);
}


void CrooksMaximumLikelihood::checkInput() const
{
	if ( work_forwards_.size() != work_backwards_.size() ) {
		throw SampleLengthMismatchError( work_forwards_.size(), work_backwards_.size() );
	}
	if ( work_forwards_.empty() ) {
		throw InvalidInputError("at least one forward/backward pair is needed");
	}
	if ( not std::isfinite(beta_) ) {
		throw InvalidInputError("beta must be finite");
	}
	if ( not std::isfinite(delta_g_guess_) ) {
		throw InvalidInputError("the initial guess for Delta_G must be finite");
	}
	if ( not (tol_ > 0.0) ) {
		throw InvalidInputError("the solver tolerance must be positive");
	}
	for ( int i=0; i<num_samples_; ++i ) {
		if ( not (std::isfinite(work_forwards_[i]) and std::isfinite(work_backwards_[i])) ) {
			throw InvalidInputError("work values must be finite for the maximum-likelihood estimate");
		}
	}
}


double CrooksMaximumLikelihood::computeInitialGuess(
	const std::vector<double>& work_forwards, const std::vector<double>& work_backwards)
{
	if ( work_forwards.empty() or work_backwards.empty() ) {
		throw InvalidInputError("at least one forward/backward pair is needed");
	}

	double avg_f = 0.0;
	for ( const double w : work_forwards ) {
		avg_f += w;
	}
	avg_f /= static_cast<double>( work_forwards.size() );

	double avg_b = 0.0;
	for ( const double w : work_backwards ) {
		avg_b += w;
	}
	avg_b /= static_cast<double>( work_backwards.size() );

	// Crooks: <W_F> >= Delta_G >= -<W_B>
	return 0.5*(avg_f - avg_b);
}


double CrooksMaximumLikelihood::solve(const double delta_g_guess)
{
	ColumnVector delta_g(1);
	delta_g(0) = delta_g_guess;

	// With beta = 0 every hypothesis is equally likely, and a zero gradient
	// at the guess means there is nothing left to do
	const ColumnVector grad_guess = evalObjectiveDerivatives(delta_g);
	if ( beta_ == 0.0 or grad_guess(0) == 0.0 ) {
		min_A_ = evalObjectiveFunction(delta_g);
		return delta_g(0);
	}

	// Invoke functor wrappers for dlib calls
	CrooksDlibEvalWrapper  evaluate_wrapper(*this);
	CrooksDlibDerivWrapper derivatives_wrapper(*this);

	// Call dlib to perform the optimization
	min_A_ = dlib::find_min(
			dlib::bfgs_search_strategy(),
			dlib::objective_delta_stop_strategy(tol_),
			evaluate_wrapper,
			derivatives_wrapper,
			delta_g,
			std::numeric_limits<double>::lowest()
	);

	return delta_g(0);
}


double CrooksMaximumLikelihood::evalObjectiveFunction(const ColumnVector& delta_g) const
{
	const double g = delta_g(0);

	double val = 0.0;
	#pragma omp parallel for reduction(+:val)
	for ( int i=0; i<num_samples_; ++i ) {
		val += numeric::logLogistic( beta_*(work_forwards_[i]  - g) )
		     + numeric::logLogistic( beta_*(work_backwards_[i] + g) );
	}

	return -val*inv_num_samples_;
}


const CrooksMaximumLikelihood::ColumnVector CrooksMaximumLikelihood::evalObjectiveDerivatives(
	const ColumnVector& delta_g) const
{
	const double g = delta_g(0);

	double sum = 0.0;
	#pragma omp parallel for reduction(+:sum)
	for ( int i=0; i<num_samples_; ++i ) {
		sum += numeric::logistic( beta_*(work_forwards_[i]  - g) )
		     - numeric::logistic( beta_*(work_backwards_[i] + g) );
	}

	ColumnVector grad(1);
	grad(0) = beta_*sum*inv_num_samples_;
	return grad;
}
