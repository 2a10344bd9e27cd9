// Timer: named region timer backed by the GPTL library
// - GPTLinitialize() must have been called before any Timer is started
//   (see GptlSession below)

#pragma once
#ifndef CROOKS_TIMER_H
#define CROOKS_TIMER_H

#include <stdexcept>
#include <string>

#include "gptl.h"

class Timer
{
 public:
	explicit Timer(const std::string& name):
		name_(name)
	{}

	void start() {
		if ( GPTLstart(name_.c_str()) < 0 ) {
			throw std::runtime_error("GPTLstart failed for timer \"" + name_ + "\"");
		}
	}

	void stop() {
		if ( GPTLstop(name_.c_str()) < 0 ) {
			throw std::runtime_error("GPTLstop failed for timer \"" + name_ + "\"");
		}
	}

	const std::string& getName() const noexcept {
		return name_;
	}

 private:
	std::string name_;
};


// Initializes GPTL for the lifetime of the object, and writes the timing
// report on request
class GptlSession
{
 public:
	GptlSession() {
		if ( GPTLinitialize() < 0 ) {
			throw std::runtime_error("GPTLinitialize failed");
		}
	}

	// Nothing can be reported from a destructor
	~GptlSession() {
		static_cast<void>( GPTLfinalize() );
	}

	GptlSession(const GptlSession&) = delete;
	GptlSession& operator=(const GptlSession&) = delete;

	void printReport(const std::string& file_name) const {
		if ( GPTLpr_file(file_name.c_str()) < 0 ) {
			throw std::runtime_error("unable to write GPTL timing report to " + file_name);
		}
	}
};

#endif // ifndef CROOKS_TIMER_H
