#include "cli/converter.hpp"

#include "json/jsonEncoder.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace cfgjson {

std::string readFile(const std::string &path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		throw std::runtime_error("Cannot open file: " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	return buffer.str();
}

static bool isBlank(const std::string &text) {
	return std::all_of(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

Converter::Converter(Options options, std::istream &in, std::ostream &out, std::ostream &err)
	: options(std::move(options)), in(in), out(out), err(err) {}

int Converter::run() {
	try {
		std::string filename;
		std::string source = readInput(filename);

		if (options.printTokens) {
			printTokens(source, filename);
			return 0;
		}

		status("Parsing...");
		Document document = convert(source, filename);
		std::string json = dumpDocument(document);

		writeOutput(json);
		status("Saved: " + options.outputPath);
		if (!options.quiet) {
			out << json << "\n";
		}
		return 0;
	} catch (const std::exception &e) {
		// SyntaxError, UsageError (empty input) and I/O or filesystem failures
		err << "Error: " << e.what() << "\n";
	}
	return 1;
}

Document Converter::convert(const std::string &source, const std::string &filename) {
	Lexer lexer(source, filename);
	Parser parser(lexer);
	ParseContext context;
	Document document = parser.parse(context);
	log("parsed " + std::to_string(context.statementCount) + " statements, " + std::to_string(document.size()) +
		" entries, " + std::to_string(context.constants.size()) + " constants");
	return document;
}

std::string Converter::readInput(std::string &filename) {
	if (!options.inputPath.empty()) {
		filename = options.inputPath;
		std::string source = readFile(options.inputPath);
		status("Loaded: " + options.inputPath);
		log("read " + std::to_string(source.size()) + " bytes from " + options.inputPath);
		return source;
	}

	filename = "<stdin>";
	std::stringstream buffer;
	buffer << in.rdbuf();
	std::string source = buffer.str();
	if (isBlank(source)) {
		throw UsageError("input is empty");
	}
	log("read " + std::to_string(source.size()) + " bytes from standard input");
	return source;
}

void Converter::writeOutput(const std::string &json) {
	fs::path outputPath(options.outputPath);
	if (outputPath.has_parent_path()) {
		fs::create_directories(outputPath.parent_path());
	}

	std::ofstream file(outputPath, std::ios::binary);
	if (!file) {
		throw std::runtime_error("Cannot write file: " + options.outputPath);
	}
	file << json;
	if (!file) {
		throw std::runtime_error("Failed writing file: " + options.outputPath);
	}
	log("wrote " + std::to_string(json.size()) + " bytes to " + options.outputPath);
}

void Converter::printTokens(const std::string &source, const std::string &filename) {
	Lexer lexer(source, filename);
	for (const Token &token : lexer.tokenize()) {
		out << token.line() << ':' << token.column() << ' ' << tokenTypeToString(token.type);
		if (token.type != TokenType::END_OF_FILE) {
			out << " '" << token.lexeme << "'";
		}
		out << "\n";
	}
}

void Converter::status(const std::string &message) {
	if (!options.quiet) {
		err << message << "\n";
	}
}

void Converter::log(const std::string &message) {
	if (options.debug) {
		err << "[cfgjson] " << message << std::endl;
	}
}

} // namespace cfgjson
