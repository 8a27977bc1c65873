#include "sys/util.hpp"

#include <sstream>

#include "sys/log.hpp"

Settings::Settings()
    : max_expansion_exponent(DEFAULT_MAX_EXPANSION_EXPONENT) {}

enum class Option { NONE, MAX_EXPANSION_EXPONENT, LOG_LEVEL };

std::vector<std::string> Settings::parseArgs(int argc, char *argv[]) {
  Option option(Option::NONE);
  std::vector<std::string> unparsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (option == Option::MAX_EXPANSION_EXPONENT) {
      std::stringstream s(arg);
      int64_t val = -1;
      s >> val;
      if (s.fail() || val < 0) {
        Log::get().error("Invalid value for option: " + arg, true);
      }
      max_expansion_exponent = val;
      option = Option::NONE;
    } else if (option == Option::LOG_LEVEL) {
      if (arg == "debug") {
        Log::get().level = Log::Level::DEBUG;
      } else if (arg == "info") {
        Log::get().level = Log::Level::INFO;
      } else if (arg == "warn") {
        Log::get().level = Log::Level::WARN;
      } else if (arg == "error") {
        Log::get().level = Log::Level::ERROR;
      } else {
        Log::get().error("Unknown log level: " + arg, true);
      }
      option = Option::NONE;
    } else if (!arg.empty() && arg.at(0) == '-') {
      std::string opt = arg.substr(1);
      if (opt == "e") {
        option = Option::MAX_EXPANSION_EXPONENT;
      } else if (opt == "l") {
        option = Option::LOG_LEVEL;
      } else {
        Log::get().error("Unknown option: -" + opt, true);
      }
    } else {
      unparsed.push_back(arg);
    }
  }
  if (option != Option::NONE) {
    Log::get().error("Missing argument", true);
  }
  return unparsed;
}

void Settings::printArgs(std::vector<std::string> &args) {
  if (max_expansion_exponent != DEFAULT_MAX_EXPANSION_EXPONENT) {
    args.push_back("-e");
    args.push_back(std::to_string(max_expansion_exponent));
  }
}
