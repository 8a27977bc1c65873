#include "eval/evaluator.hpp"

#include <cmath>
#include <stdexcept>

#include "sys/log.hpp"

EvalError::EvalError() : type(Type::NONE) {}

EvalError::EvalError(Type type, const Symbol& symbol)
    : type(type), symbol(symbol) {}

std::string EvalError::toString() const {
  switch (type) {
    case Type::NONE:
      return "no error";
    case Type::UNBOUND_SYMBOL:
      return "unbound symbol: " + symbol.name;
    case Type::DIVISION_BY_ZERO:
      return "division by zero";
  }
  return "unknown error";
}

EvalResult::EvalResult(double value) : value(value) {}

EvalResult::EvalResult(const EvalError& error)
    : value(std::nan("")), error(error) {}

EvalResult Evaluator::eval(const Expression& e, const Bindings& bindings) {
  auto result = evalTerm(e, bindings);
  if (!result.ok()) {
    Log::get().debug("Cannot evaluate " + e.toString() + ": " +
                     result.error.toString());
  }
  return result;
}

void assertBinary(const Expression& e) {
  if (e.children.size() != 2) {
    throw std::runtime_error("unexpected number of terms in " +
                             e.toString());
  }
}

EvalResult Evaluator::evalTerm(const Expression& e, const Bindings& bindings) {
  switch (e.type) {
    case Expression::Type::CONSTANT: {
      return EvalResult(e.value);
    }
    case Expression::Type::VARIABLE: {
      auto it = bindings.find(e.symbol);
      if (it == bindings.end()) {
        return EvalResult(
            EvalError(EvalError::Type::UNBOUND_SYMBOL, e.symbol));
      }
      return EvalResult(it->second);
    }
    case Expression::Type::SUM: {
      double result = 0;
      for (const auto& c : e.children) {
        auto r = evalTerm(c, bindings);
        if (!r.ok()) {
          return r;
        }
        result += r.value;
      }
      return EvalResult(result);
    }
    case Expression::Type::PRODUCT: {
      double result = 1;
      for (const auto& c : e.children) {
        auto r = evalTerm(c, bindings);
        if (!r.ok()) {
          return r;
        }
        result *= r.value;
      }
      return EvalResult(result);
    }
    case Expression::Type::DIFFERENCE:
    case Expression::Type::FRACTION:
    case Expression::Type::POWER: {
      assertBinary(e);
      auto a = evalTerm(e.children[0], bindings);
      if (!a.ok()) {
        return a;
      }
      auto b = evalTerm(e.children[1], bindings);
      if (!b.ok()) {
        return b;
      }
      if (e.type == Expression::Type::DIFFERENCE) {
        return EvalResult(a.value - b.value);
      } else if (e.type == Expression::Type::FRACTION) {
        if (b.value == 0) {
          return EvalResult(EvalError(EvalError::Type::DIVISION_BY_ZERO));
        }
        return EvalResult(a.value / b.value);
      }
      return EvalResult(std::pow(a.value, b.value));
    }
  }
  throw std::runtime_error("cannot evaluate " + e.toString());
}
