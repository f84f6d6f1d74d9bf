#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace cfgjson {

// Bad command line or unusable input; reported with the usage text
class UsageError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct Options {
	// Empty: read standard input
	std::string inputPath;
	std::string outputPath = "output.json";
	// Print the token stream instead of converting
	bool printTokens = false;
	// No status messages, no JSON echo on stdout
	bool quiet = false;
	// Debug logging to stderr
	bool debug = false;
	bool showHelp = false;
};

// Throws UsageError on unknown options, a missing option value or a second input path
Options parseOptions(int argc, const char *const argv[]);

void printUsage(std::ostream &out, const char *program);

} // namespace cfgjson
