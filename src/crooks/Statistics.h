// Statistics: basic estimators for a set of samples

#ifndef STATISTICS_H
#define STATISTICS_H

#include <cmath>
#include <vector>

#include "utils.h"

namespace Statistics
{

template<typename T>
double average(const std::vector<T>& x)
{
	const int num_values = x.size();
	CROOKS_ASSERT( num_values > 0, "no data provided" );

	double avg = 0.0;
	for ( int i=0; i<num_values; ++i ) {
		avg += x[i];
	}
	avg /= static_cast<double>(num_values);

	return avg;
}

// Variance with 'delta_dof' degrees of freedom removed
// - delta_dof = 0: population variance
// - delta_dof = 1: unbiased sample variance
template<typename T>
double variance(const std::vector<T>& x, const int delta_dof = 0)
{
	const int num_values = x.size();
	CROOKS_ASSERT( num_values > delta_dof,
	               "need more than " << delta_dof << " values, got " << num_values );

	double var = 0.0;
	double dx, avg_x = average(x);
	for ( int i=0; i<num_values; ++i ) {
		dx = x[i] - avg_x;
		var += dx*dx;
	}
	var /= static_cast<double>(num_values - delta_dof);

	return var;
}

template<typename T>
double std_dev(const std::vector<T>& x, const int delta_dof = 0)
{
	return std::sqrt( variance(x, delta_dof) );
}

} // end namespace Statistics

#endif // ifndef STATISTICS_H
