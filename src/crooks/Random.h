// Random: helper routines for seeding random number generators

#ifndef RANDOM_H
#define RANDOM_H

#include <random>
#include <vector>

#include "utils.h"


namespace Random
{

// std::seed_seq is not copyable, so seeds are passed around as plain vectors
// which can be used to construct one

// Draws 'num_values' seeds from std::random_device
std::vector<int> generateRandomSequence(const int num_values = 10);

// Returns a fixed sequence, so that runs can be reproduced exactly
std::vector<int> getDebugSequence();

// Picks one of the above
std::vector<int> getSeeds(const bool reproducible);

} // end namespace Random

#endif // ifndef RANDOM_H
