// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#ifndef LOGISTIC_HPP
#define LOGISTIC_HPP

#include <algorithm>
#include <cmath>
#include <vector>

namespace numeric
{

// Acceptance form of the logistic function:
//      s(z) = 1/(1 + exp(z))
// - Decreasing in z: s(-inf) = 1, s(0) = 1/2, s(+inf) = 0
// - Only exp(-|z|) is ever evaluated, so this never overflows
// - THREAD_SAFE
template<typename T>
T logistic(const T z)
{
	if ( z >= 0.0 ) {
		const T e = std::exp(-z);
		return e/(1.0 + e);
	}
	else {
		return 1.0/(1.0 + std::exp(z));
	}
}

// Elementwise logistic of a set of values
template<typename T>
void logistic(const std::vector<T>& z, std::vector<T>& s)
{
	const int num_values = static_cast<int>( z.size() );
	s.resize(num_values);
	#pragma omp simd
	for ( int i=0; i<num_values; ++i ) {
		s[i] = logistic(z[i]);
	}
}

template<typename T>
std::vector<T> logistic(const std::vector<T>& z)
{
	std::vector<T> s;
	logistic(z, s);
	return s;
}

// log(s(z)) = -log(1 + exp(z)) = -softplus(z)
// - Evaluated as -[max(z,0) + log1p(exp(-|z|))], which stays finite for all finite z
template<typename T>
T logLogistic(const T z)
{
	return -( std::max(z, static_cast<T>(0.0)) + std::log1p( std::exp(-std::abs(z)) ) );
}

}

#endif // ifndef LOGISTIC_HPP
