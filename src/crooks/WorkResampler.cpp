#include "WorkResampler.h"

namespace {

// std::seed_seq can be neither copied nor moved, so the engine is seeded from a
// temporary one
WorkResampler::Engine makeEngine(const std::vector<int>& seeds)
{
	std::seed_seq seed_sequence(seeds.begin(), seeds.end());
	return WorkResampler::Engine(seed_sequence);
}

} // end anonymous namespace


WorkResampler::WorkResampler(const int num_samples, const std::vector<int>& seeds):
	num_samples_(num_samples),
	engine_( makeEngine(seeds) ),
	index_distribution_( 0, (num_samples > 0) ? num_samples - 1 : 0 )
{
	CROOKS_ASSERT( num_samples_ > 0, "cannot resample an empty work series" );
}


void WorkResampler::drawIndices(std::vector<int>& indices)
{
	indices.resize(num_samples_);
	for ( int i=0; i<num_samples_; ++i ) {
		indices[i] = index_distribution_(engine_);
	}
}


void WorkResampler::draw(const std::vector<double>& values, std::vector<double>& resampled)
{
	CROOKS_ASSERT( static_cast<int>(values.size()) == num_samples_,
	               "expected " << num_samples_ << " work values, got " << values.size() );

	drawIndices(indices_);

	resampled.resize(num_samples_);
	for ( int i=0; i<num_samples_; ++i ) {
		resampled[i] = values[ indices_[i] ];
	}
}
