#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace cfgjson {

struct Diagnostic {
  std::string message;
  std::string filePath;
  size_t line;
  size_t column;
  // Set for token-expectation mismatches, empty otherwise
  std::string expected;
  std::string actual;

  Diagnostic(std::string msg, std::string file = "", size_t lineNum = 0, size_t colNum = 0)
      : message(std::move(msg)), filePath(std::move(file)), line(lineNum), column(colNum) {}

  Diagnostic(std::string expectedWhat, std::string actualWhat, std::string file, size_t lineNum, size_t colNum)
      : message("expected " + expectedWhat + ", got " + actualWhat), filePath(std::move(file)), line(lineNum),
        column(colNum), expected(std::move(expectedWhat)), actual(std::move(actualWhat)) {}

  std::string toString() const {
    std::string location;
    if (!filePath.empty()) {
      location = filePath + ":";
    }
    if (line > 0) {
      location += std::to_string(line) + ":" + std::to_string(column) + ": ";
    } else if (!location.empty()) {
      location += " ";
    }
    return location + message;
  }
};

} // namespace cfgjson
