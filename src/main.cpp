#include "cli/converter.hpp"
#include "cli/options.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
	cfgjson::Options options;
	try {
		options = cfgjson::parseOptions(argc, argv);
	} catch (const cfgjson::UsageError &e) {
		std::cerr << "Error: " << e.what() << "\n\n";
		cfgjson::printUsage(std::cerr, argv[0]);
		return 1;
	}

	if (options.showHelp) {
		cfgjson::printUsage(std::cout, argv[0]);
		return 0;
	}

	cfgjson::Converter converter(options);
	return converter.run();
}
