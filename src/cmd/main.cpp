#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "cmd/test.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

int dispatch(Test &test, const std::string &name) {
  if (name == "all") {
    test.all();
  } else if (name == "symbol") {
    test.symbol();
  } else if (name == "expression") {
    test.expression();
  } else if (name == "print") {
    test.print();
  } else if (name == "simplify") {
    test.simplify();
  } else if (name == "expand") {
    test.expand();
  } else if (name == "eval") {
    test.eval();
  } else if (name == "operators") {
    test.operators();
  } else if (name == "config") {
    test.config();
  } else {
    Log::get().error("Unknown test: " + name);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
  Settings settings;
  try {
    auto args = settings.parseArgs(argc, argv);
    if (args.empty()) {
      args.push_back("all");
    }
    Test test(settings);
    for (const auto &name : args) {
      if (dispatch(test, name) != EXIT_SUCCESS) {
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception &e) {
    Log::get().error(std::string("Test failed: ") + e.what());
    return EXIT_FAILURE;
  }
  Log::get().info("All tests passed");
  return EXIT_SUCCESS;
}
