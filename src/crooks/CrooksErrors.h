// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef CROOKS_ERRORS_H
#define CROOKS_ERRORS_H

#include <stdexcept>
#include <string>

// Errors raised by the Crooks-Bayes estimators
// - All of them are fatal to a run: nothing is retried internally


// Bad hypothesis range and/or grid spacing
class InvalidRangeError : public std::runtime_error
{
 public:
	explicit InvalidRangeError(const std::string& what_arg):
		std::runtime_error("invalid hypothesis range: " + what_arg)
	{}
};


// Forward and backward work series have different lengths
class SampleLengthMismatchError : public std::runtime_error
{
 public:
	SampleLengthMismatchError(const std::size_t num_forward, const std::size_t num_backward):
		std::runtime_error(
			"the number of forward protocols (" + std::to_string(num_forward) + ") must be equal to "
			"the number of backward protocols (" + std::to_string(num_backward) + ")"
		),
		num_forward_(num_forward),
		num_backward_(num_backward)
	{}

	std::size_t getNumForward()  const noexcept { return num_forward_;  }
	std::size_t getNumBackward() const noexcept { return num_backward_; }

 private:
	std::size_t num_forward_, num_backward_;
};


// A sample produced a likelihood (or posterior) whose integral over the grid
// is zero or non-finite
// - Usually means the hypothesis range does not overlap the region the data supports
class DegenerateLikelihoodError : public std::runtime_error
{
 public:
	explicit DegenerateLikelihoodError(const std::string& what_arg):
		std::runtime_error("degenerate likelihood: " + what_arg)
	{}
};


// Input values that can never produce an estimate (no samples, non-finite beta, ...)
class InvalidInputError : public std::runtime_error
{
 public:
	explicit InvalidInputError(const std::string& what_arg):
		std::runtime_error("invalid input: " + what_arg)
	{}
};

#endif // ifndef CROOKS_ERRORS_H
