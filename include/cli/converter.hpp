#pragma once

#include "cli/options.hpp"
#include "value/value.hpp"

#include <iostream>
#include <string>

namespace cfgjson {

/**
 * Command-line driver: reads the input, parses it and writes the JSON file.
 *
 * The output file is written only after a successful parse, so a syntax error
 * never leaves a partial document behind.
 */
class Converter {
public:
	explicit Converter(Options options, std::istream &in = std::cin, std::ostream &out = std::cout,
					   std::ostream &err = std::cerr);

	// Returns the process exit status: 0 on success, 1 on any error
	int run();

	// Parse source text into a document (throws SyntaxError)
	Document convert(const std::string &source, const std::string &filename);

private:
	Options options;
	std::istream &in;
	std::ostream &out;
	std::ostream &err;

	// Returns the source text and sets `filename` for diagnostics
	std::string readInput(std::string &filename);
	void writeOutput(const std::string &json);
	void printTokens(const std::string &source, const std::string &filename);

	void status(const std::string &message);
	void log(const std::string &message);
};

// Read a whole file; throws std::runtime_error when it cannot be opened
std::string readFile(const std::string &path);

} // namespace cfgjson
