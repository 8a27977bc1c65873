#pragma once

#include <cstdint>
#include <string>
#include <vector>

class Settings {
 public:
  static constexpr int64_t DEFAULT_MAX_EXPANSION_EXPONENT = 32;

  // largest integer exponent that the expander unrolls into a product
  int64_t max_expansion_exponent;

  Settings();

  std::vector<std::string> parseArgs(int argc, char *argv[]);

  void printArgs(std::vector<std::string> &args);
};
