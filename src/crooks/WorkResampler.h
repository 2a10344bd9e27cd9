// WorkResampler: draws bootstrap resamples (with replacement) of one work series
// - Forward and backward work each get their own resampler, seeded differently,
//   so that the two directions are resampled independently

#ifndef WORK_RESAMPLER_H
#define WORK_RESAMPLER_H

#include <random>
#include <vector>

#include "utils.h"

class WorkResampler
{
 public:
	using Engine = std::mt19937;

	WorkResampler(
		const int num_samples,         // length of the series to resample
		const std::vector<int>& seeds  // see Random::getSeeds()
	);

	// Fills 'indices' with 'num_samples' indices drawn uniformly from [0, num_samples-1]
	void drawIndices(std::vector<int>& indices);

	// Fills 'resampled' with values[j] for a fresh set of indices j
	void draw(const std::vector<double>& values, std::vector<double>& resampled);

	int getNumSamples() const noexcept {
		return num_samples_;
	}

 private:
	int num_samples_;

	Engine engine_;
	std::uniform_int_distribution<int> index_distribution_;

	std::vector<int> indices_;
};

#endif // ifndef WORK_RESAMPLER_H
