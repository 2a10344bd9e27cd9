#pragma once
#ifndef CROOKS_DLIB_WRAPPERS_H
#define CROOKS_DLIB_WRAPPERS_H

// Library headers
#include "dlib/optimization.h"

// Project headers
#include "CrooksMaximumLikelihood.h"

class CrooksMaximumLikelihood;

//----- Wrapper for the objective function -----//

class CrooksDlibEvalWrapper
{
 public:
	using ColumnVector = dlib::matrix<double,0,1>;

	CrooksDlibEvalWrapper(const CrooksMaximumLikelihood& mle);

	double operator() (const ColumnVector& delta_g) const;

 private:
	const CrooksMaximumLikelihood* mle_ptr_;

};


//----- Wrapper for derivatives of the objective function -----//

class CrooksDlibDerivWrapper
{
 public:
	using ColumnVector = dlib::matrix<double,0,1>;

	CrooksDlibDerivWrapper(const CrooksMaximumLikelihood& mle);

	const ColumnVector operator() (const ColumnVector& delta_g) const;

 private:
	const CrooksMaximumLikelihood* mle_ptr_;
};

#endif // CROOKS_DLIB_WRAPPERS_H
