// WorkSeries
//
// ABOUT: Reads in and stores the work measured in a series of repeated
//        (forward or backward) driving protocols

#ifndef WORK_SERIES_H
#define WORK_SERIES_H

// Standard headers
#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Statistics.h"
#include "utils.h"

class WorkSeries
{
 public:
	// Construct using data stored in a file
	// - One sample per non-empty, non-comment line
	// - 'col' is indexed from 0
	WorkSeries(
		const std::string& file,
		const int col
	);

	// Construct using a set of plain values
	WorkSeries(const std::vector<double>& data):
		data_(data)
	{}

	WorkSeries():
		data_(0)
	{}

	// Returns the number of samples
	unsigned size() const { return data_.size(); }

	const std::string& get_file() const { return file_; }

	// Access underlying data
	const double& operator[](const int i) const;
	const std::vector<double>& get_data() const { return data_; }

	// Statistics of stored work values
	double average()  const { return Statistics::average(data_); }
	double variance() const { return Statistics::variance(data_); }

 private:
	// Where data is stored, and what to read in
	std::string file_ = "";
	int col_ = -1;

	std::vector<double> data_;
};

inline
const double& WorkSeries::operator[](const int i) const {
	return data_[i];
}

#endif /* WORK_SERIES_H */
