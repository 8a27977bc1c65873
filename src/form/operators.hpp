#pragma once

#include "form/expression_util.hpp"

// Infix notation for building expressions, e.g. (x + y) * x - 2

inline Expression operator+(const Expression& a, const Expression& b) {
  return ExpressionUtil::add(a, b);
}

inline Expression operator-(const Expression& a, const Expression& b) {
  return ExpressionUtil::sub(a, b);
}

inline Expression operator*(const Expression& a, const Expression& b) {
  return ExpressionUtil::mul(a, b);
}

inline Expression operator/(const Expression& a, const Expression& b) {
  return ExpressionUtil::div(a, b);
}

inline Expression operator-(const Expression& e) {
  return ExpressionUtil::mul(ExpressionUtil::newNumber(-1), e);
}

inline Expression operator+(const Expression& a, double b) {
  return a + ExpressionUtil::newNumber(b);
}

inline Expression operator+(double a, const Expression& b) {
  return ExpressionUtil::newNumber(a) + b;
}

inline Expression operator-(const Expression& a, double b) {
  return a - ExpressionUtil::newNumber(b);
}

inline Expression operator-(double a, const Expression& b) {
  return ExpressionUtil::newNumber(a) - b;
}

inline Expression operator*(const Expression& a, double b) {
  return a * ExpressionUtil::newNumber(b);
}

inline Expression operator*(double a, const Expression& b) {
  return ExpressionUtil::newNumber(a) * b;
}

inline Expression operator/(const Expression& a, double b) {
  return a / ExpressionUtil::newNumber(b);
}

inline Expression operator/(double a, const Expression& b) {
  return ExpressionUtil::newNumber(a) / b;
}

inline Expression pow(const Expression& base, const Expression& exponent) {
  return ExpressionUtil::pow(base, exponent);
}

inline Expression pow(const Expression& base, double exponent) {
  return ExpressionUtil::pow(base, ExpressionUtil::newNumber(exponent));
}
