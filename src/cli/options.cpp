#include "cli/options.hpp"

namespace cfgjson {

void printUsage(std::ostream &out, const char *program) {
	out << "Usage: " << program << " [input] [-o <output.json>]\n";
	out << "\nReads the configuration from [input], or from standard input when omitted,\n";
	out << "and writes it as JSON.\n";
	out << "\nOptions:\n";
	out << "  -o, --output <path>  Output JSON file (default: output.json)\n";
	out << "  --tokens             Print the token stream instead of converting\n";
	out << "  --quiet              Suppress status messages and the JSON echo\n";
	out << "  --debug              Enable debug logging\n";
	out << "  -h, --help           Show this help\n";
}

Options parseOptions(int argc, const char *const argv[]) {
	Options options;
	bool haveInput = false;

	for (int argIndex = 1; argIndex < argc; argIndex++) {
		std::string arg = argv[argIndex];
		if (arg == "-o" || arg == "--output") {
			if (argIndex + 1 >= argc) {
				throw UsageError("option " + arg + " requires a path");
			}
			options.outputPath = argv[++argIndex];
		} else if (arg.starts_with("--output=")) {
			options.outputPath = arg.substr(std::string("--output=").size());
		} else if (arg == "--tokens") {
			options.printTokens = true;
		} else if (arg == "--quiet") {
			options.quiet = true;
		} else if (arg == "--debug") {
			options.debug = true;
		} else if (arg == "--help" || arg == "-h") {
			options.showHelp = true;
		} else if (arg.size() > 1 && arg[0] == '-') {
			throw UsageError("unknown option: " + arg);
		} else if (haveInput) {
			throw UsageError("more than one input file: " + arg);
		} else {
			options.inputPath = arg;
			haveInput = true;
		}
	}

	if (options.outputPath.empty()) {
		throw UsageError("output path is empty");
	}
	return options;
}

} // namespace cfgjson
