#pragma once

#include <cstddef>
#include <string>

namespace cfgjson {

struct SourceLocation {
  size_t line{};
  size_t column{};
  std::string filename;

  std::string toString() const {
    return filename + ":" + std::to_string(line) + ":" + std::to_string(column);
  }
};

} // namespace cfgjson
