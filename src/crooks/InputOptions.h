// AUTHOR: Sean M. Marks (https://github.com/seanmarks)

#pragma once
#ifndef INPUT_OPTIONS_H
#define INPUT_OPTIONS_H

#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

// Reads "key = value" options from an input file
// - '#' begins a comment (anywhere on a line)
// - Keys are case-sensitive and may only be defined once
class InputOptions
{
 public:
	enum class KeyType { Required, Optional };

	InputOptions() = default;

	// Reads the given file
	explicit InputOptions(const std::string& file);

	// Reads options from a stream
	// - 'source_name' is used in error messages
	void parse(std::istream& is, const std::string& source_name);

	// The read* functions below return true if the key was found. A missing
	// Required key, or a value which cannot be converted, throws.
	bool readString(const std::string& key, const KeyType type, std::string& value) const;

	template<typename T>
	bool readNumber(const std::string& key, const KeyType type, T& value) const;

	// Accepts yes/no, true/false, on/off, 1/0
	bool readFlag(const std::string& key, const KeyType type, bool& value) const;

	bool hasKey(const std::string& key) const {
		return ( values_.find(key) != values_.end() );
	}

	// File the options were read from (empty if read from a stream)
	const std::string& getFile() const noexcept {
		return file_;
	}

 private:
	std::string file_ = "";
	std::string source_name_ = "";

	std::map<std::string, std::string> values_;

	// Returns a pointer to the value, or nullptr if the key is absent
	const std::string* findValue(const std::string& key, const KeyType type) const;

	void throwBadValue(const std::string& key, const std::string& value,
	                    const std::string& expected) const;
};


template<typename T>
bool InputOptions::readNumber(const std::string& key, const KeyType type, T& value) const
{
	const std::string* value_ptr = findValue(key, type);
	if ( value_ptr == nullptr ) {
		return false;
	}

	std::istringstream ss(*value_ptr);
	T tmp;
	std::string leftover;
	if ( not (ss >> tmp) or (ss >> leftover) ) {
		throwBadValue(key, *value_ptr, "a number");
	}
	value = tmp;

	return true;
}

#endif // ifndef INPUT_OPTIONS_H
