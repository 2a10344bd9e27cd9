#include "WorkSeries.h"

WorkSeries::WorkSeries(const std::string& file, const int col):
	file_(file), col_(col)
{
	CROOKS_ASSERT( col_ >= 0, "invalid column index " << col_ << " for work file " << file_ );

	std::ifstream ifs( file_ );
	if ( not ifs.is_open() ) {
		throw std::runtime_error("Failed to open work file \'" + file_ + "\'");
	}

	// Working variables
	std::string line, token;
	std::vector<std::string> tokens;
	int line_number = 0;

	while ( getline(ifs, line) ) {
		++line_number;
		std::stringstream ss(line);

		// Ignore comments and blank lines
		if ( not (ss >> token) or token[0] == '#' ) {
			continue;
		}

		// Tokenize the line (stopping at a trailing comment)
		tokens = {{ token }};
		while ( ss >> token and token[0] != '#' ) {
			tokens.push_back( token );
		}

		if ( static_cast<int>(tokens.size()) < col_ + 1 ) {
			std::stringstream err_ss;
			err_ss << "work file " << file_ << ", line " << line_number << ": expected at least "
			       << col_ + 1 << " columns, found " << tokens.size();
			throw std::runtime_error( err_ss.str() );
		}

		// Store data
		std::size_t num_parsed = 0;
		double value = 0.0;
		try {
			value = std::stod( tokens[col_], &num_parsed );
		}
		catch (const std::logic_error&) {
			// std::invalid_argument or std::out_of_range: reported below
			num_parsed = 0;
		}
		if ( num_parsed != tokens[col_].size() ) {
			std::stringstream err_ss;
			err_ss << "work file " << file_ << ", line " << line_number << ": unable to parse \'"
			       << tokens[col_] << "\' as a number";
			throw std::runtime_error( err_ss.str() );
		}
		data_.push_back( value );
	}
	ifs.close();
}
