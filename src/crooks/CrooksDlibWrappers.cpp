#include "CrooksDlibWrappers.h"

//----- Objective Function Wrapper -----//

CrooksDlibEvalWrapper::CrooksDlibEvalWrapper(const CrooksMaximumLikelihood& mle)
 : mle_ptr_(&mle)
{
}


double CrooksDlibEvalWrapper::operator() (const CrooksMaximumLikelihood::ColumnVector& delta_g) const
{
	return mle_ptr_->evalObjectiveFunction(delta_g);
}



//----- Objective Function Derivatives Wrapper -----//

CrooksDlibDerivWrapper::CrooksDlibDerivWrapper(const CrooksMaximumLikelihood& mle)
 : mle_ptr_(&mle)
{
}


const CrooksMaximumLikelihood::ColumnVector CrooksDlibDerivWrapper::operator() (
	const CrooksMaximumLikelihood::ColumnVector& delta_g) const
{
	return mle_ptr_->evalObjectiveDerivatives(delta_g);
}
