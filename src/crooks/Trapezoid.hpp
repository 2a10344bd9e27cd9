// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#ifndef TRAPEZOID_HPP
#define TRAPEZOID_HPP

#include <vector>

#include "utils.h"

namespace numeric
{

// Definite integral of a sampled function using the composite trapezoidal rule:
//      I = sum_{i=1}^{n-1} (x[i] - x[i-1])*(y[i] + y[i-1])/2
// - Grid points need not be evenly spaced
// - THREAD_SAFE
template<typename T>
T trapz(const std::vector<T>& x, const std::vector<T>& y)
{
	const int num_points = static_cast<int>( x.size() );
	CROOKS_ASSERT( static_cast<int>(y.size()) == num_points,
	               "length mismatch: got " << num_points << " points but " << y.size() << " values" );
	CROOKS_ASSERT( num_points >= 2, "at least 2 points are needed, got " << num_points );

	T sum = 0.0;
	#pragma omp simd reduction(+: sum)
	for ( int i=1; i<num_points; ++i ) {
		sum += (x[i] - x[i-1])*(y[i] + y[i-1]);
	}

	return 0.5*sum;
}

// Integral of f(x)*y(x) for f(x) = x^power (power = 1 or 2)
// - Equivalent to trapz(x, x^power .* y) without the temporary
template<typename T>
T trapzMoment(const std::vector<T>& x, const std::vector<T>& y, const int power)
{
	const int num_points = static_cast<int>( x.size() );
	CROOKS_ASSERT( static_cast<int>(y.size()) == num_points, "length mismatch" );
	CROOKS_ASSERT( power == 1 or power == 2, "unsupported moment: " << power );

	std::vector<T> xy(num_points);
	for ( int i=0; i<num_points; ++i ) {
		xy[i] = ( power == 1 ) ? x[i]*y[i] : x[i]*x[i]*y[i];
	}

	return trapz(x, xy);
}

// Running integral: cumulative[i] = integral from x[0] to x[i]
template<typename T>
void cumulativeTrapz(const std::vector<T>& x, const std::vector<T>& y, std::vector<T>& cumulative)
{
	const int num_points = static_cast<int>( x.size() );
	CROOKS_ASSERT( static_cast<int>(y.size()) == num_points, "length mismatch" );

	cumulative.assign(num_points, 0.0);
	for ( int i=1; i<num_points; ++i ) {
		cumulative[i] = cumulative[i-1] + 0.5*(x[i] - x[i-1])*(y[i] + y[i-1]);
	}
}

}

#endif // ifndef TRAPEZOID_HPP
