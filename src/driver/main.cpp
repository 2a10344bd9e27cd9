/*	main.cpp
 *
 *	ABOUT: Command-line driver for Crooks-Bayes free energy estimation
 *	USAGE: crooks_bayes_driver <options_file>
 */

// Standard headers
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

// Project headers
#include "../crooks/CrooksBayesDriver.h"
#include "../crooks/Timer.h"

int main(int argc, char* argv[])
{
	// Input checking
	if ( argc < 2 ) {
		std::cerr << "Usage:  " << argv[0] << " <options_file>\n";
		return 1;
	}

	std::string options_file(argv[1]);

	//----- Run Crooks-Bayes -----//

	try {
		GptlSession gptl_session;

		CrooksBayesDriver driver(options_file);
		driver.run_driver();

		gptl_session.printReport("timing.out");
	}
	catch (const std::exception& e) {
		std::cerr << "CROOKS-BAYES: Error - " << e.what() << "\n";
		return 1;
	}

	return 0;
}
