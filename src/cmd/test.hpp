#pragma once

#include "sys/util.hpp"

class Test {
 public:
  explicit Test(const Settings &settings);

  void all();

  void symbol();

  void expression();

  void print();

  void simplify();

  void expand();

  void eval();

  void operators();

  void config();

 private:
  Settings settings;
};
