#pragma once

#include <map>
#include <string>

#include "form/expression.hpp"

class EvalError {
 public:
  enum class Type { NONE, UNBOUND_SYMBOL, DIVISION_BY_ZERO };

  EvalError();

  explicit EvalError(Type type, const Symbol& symbol = Symbol());

  std::string toString() const;

  Type type;
  Symbol symbol;  // only set for unbound symbols
};

/**
 * Outcome of an evaluation: either a value or an error.
 */
class EvalResult {
 public:
  explicit EvalResult(double value);

  explicit EvalResult(const EvalError& error);

  bool ok() const { return error.type == EvalError::Type::NONE; }

  double value;
  EvalError error;
};

typedef std::map<Symbol, double> Bindings;

/**
 * Numeric evaluation of expressions using double precision arithmetic.
 * Variables are looked up in the given bindings. Evaluation stops at the
 * first unbound symbol or division by zero and returns it as error. Domain
 * errors of powers, e.g. (-8)^(1/3), are not errors and result in NaN.
 */
class Evaluator {
 public:
  static EvalResult eval(const Expression& e, const Bindings& bindings);

 private:
  static EvalResult evalTerm(const Expression& e, const Bindings& bindings);
};
