// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#include "InputOptions.h"

#include <algorithm>
#include <cctype>
#include <fstream>


InputOptions::InputOptions(const std::string& file):
	file_(file)
{
	std::ifstream ifs(file_);
	if ( not ifs.is_open() ) {
		throw std::runtime_error("Unable to open input file: " + file_ + "\n");
	}
	parse(ifs, file_);
}


void InputOptions::parse(std::istream& is, const std::string& source_name)
{
	source_name_ = source_name;

	auto trim = [](const std::string& s) {
		const auto first = s.find_first_not_of(" \t\r");
		if ( first == std::string::npos ) {
			return std::string("");
		}
		const auto last = s.find_last_not_of(" \t\r");
		return s.substr(first, last - first + 1);
	};

	std::string line;
	int line_number = 0;
	while ( getline(is, line) ) {
		++line_number;

		// Strip comments
		const auto comment_pos = line.find('#');
		if ( comment_pos != std::string::npos ) {
			line.erase(comment_pos);
		}
		line = trim(line);
		if ( line.empty() ) {
			continue;
		}

		const auto eq_pos = line.find('=');
		if ( eq_pos == std::string::npos ) {
			throw std::runtime_error(source_name_ + ", line " + std::to_string(line_number) +
			                         ": expected \"key = value\", got \"" + line + "\"");
		}
		const std::string key   = trim( line.substr(0, eq_pos) );
		const std::string value = trim( line.substr(eq_pos + 1) );
		if ( key.empty() or value.empty() ) {
			throw std::runtime_error(source_name_ + ", line " + std::to_string(line_number) +
			                         ": missing key or value in \"" + line + "\"");
		}

		auto ret = values_.insert( std::make_pair(key, value) );
		if ( ret.second == false ) {
			throw std::runtime_error(source_name_ + ": key \"" + key + "\" was defined more than once");
		}
	}
}


const std::string* InputOptions::findValue(const std::string& key, const KeyType type) const
{
	auto it = values_.find(key);
	if ( it != values_.end() ) {
		return &(it->second);
	}
	else if ( type == KeyType::Required ) {
		throw std::runtime_error(source_name_ + ": missing required key \"" + key + "\"");
	}
	return nullptr;
}


bool InputOptions::readString(const std::string& key, const KeyType type, std::string& value) const
{
	const std::string* value_ptr = findValue(key, type);
	if ( value_ptr == nullptr ) {
		return false;
	}
	value = *value_ptr;
	return true;
}


bool InputOptions::readFlag(const std::string& key, const KeyType type, bool& value) const
{
	const std::string* value_ptr = findValue(key, type);
	if ( value_ptr == nullptr ) {
		return false;
	}

	std::string lower(*value_ptr);
	std::transform( lower.begin(), lower.end(), lower.begin(),
	                [](unsigned char c) { return std::tolower(c); } );

	if ( lower == "yes" or lower == "true" or lower == "on" or lower == "1" ) {
		value = true;
	}
	else if ( lower == "no" or lower == "false" or lower == "off" or lower == "0" ) {
		value = false;
	}
	else {
		throwBadValue(key, *value_ptr, "a flag (yes/no)");
	}
	return true;
}


void InputOptions::throwBadValue(
	const std::string& key, const std::string& value, const std::string& expected) const
{
	throw std::runtime_error(source_name_ + ": value \"" + value + "\" for key \"" + key +
	                         "\" is not " + expected);
}
