#include "Random.h"

namespace Random
{


std::vector<int> generateRandomSequence(const int num_values)
{
	CROOKS_ASSERT( num_values > 0, "need at least one seed value, got " << num_values );

	std::random_device rd;

	std::vector<int> sequence(num_values);
	for ( int i=0; i<num_values; ++i ) {
		sequence[i] = static_cast<int>( rd() );
	}

	return sequence;
}


std::vector<int> getDebugSequence()
{
	// Random numbers from atmospheric noise (random.org)
	return { 78307901, 6985620, 40212133, 91638402 };
}


std::vector<int> getSeeds(const bool reproducible)
{
	if ( reproducible ) {
		return getDebugSequence();
	}
	else {
		return generateRandomSequence();
	}
}


} // end namespace Random
