#include "form/expander.hpp"

#include <cmath>

#include "form/expression_util.hpp"
#include "form/simplifier.hpp"
#include "sys/log.hpp"

Expander::Expander() : max_exponent(Settings::DEFAULT_MAX_EXPANSION_EXPONENT) {}

Expander::Expander(const Settings& settings)
    : max_exponent(settings.max_expansion_exponent) {}

Expression Expander::expand(const Expression& e) const {
  return Simplifier::simplify(expandTerms(e));
}

Expression newOperation(Expression::Type type,
                        std::vector<Expression> operands) {
  if (operands.size() == 1) {
    return operands.front();
  }
  Expression result(type);
  result.children = std::move(operands);
  return result;
}

// collects the summands of sums and differences, negating subtrahends
void collectSummands(const Expression& e, bool negate,
                     std::vector<Expression>& target) {
  if (e.type == Expression::Type::SUM) {
    for (const auto& c : e.children) {
      collectSummands(c, negate, target);
    }
  } else if (e.type == Expression::Type::DIFFERENCE && e.children.size() == 2) {
    collectSummands(e.children[0], negate, target);
    collectSummands(e.children[1], !negate, target);
  } else if (negate) {
    target.push_back(ExpressionUtil::mul(ExpressionUtil::newNumber(-1), e));
  } else {
    target.push_back(e);
  }
}

bool isDistributable(const Expression& e) {
  return e.type == Expression::Type::SUM ||
         (e.type == Expression::Type::DIFFERENCE && e.children.size() == 2);
}

Expression Expander::distribute(const std::vector<Expression>& factors) const {
  // every entry is the list of factors of one expanded product
  std::vector<std::vector<Expression>> products(1);
  bool distributed = false;
  for (const auto& f : factors) {
    if (!isDistributable(f)) {
      for (auto& p : products) {
        ExpressionUtil::flatten(Expression::Type::PRODUCT, f, p);
      }
      continue;
    }
    std::vector<Expression> summands;
    collectSummands(f, false, summands);
    std::vector<std::vector<Expression>> next;
    next.reserve(products.size() * summands.size());
    for (const auto& p : products) {
      for (const auto& s : summands) {
        next.push_back(p);
        ExpressionUtil::flatten(Expression::Type::PRODUCT, s, next.back());
      }
    }
    products = std::move(next);
    distributed = true;
  }
  if (!distributed) {
    return newOperation(Expression::Type::PRODUCT, products.front());
  }
  std::vector<Expression> terms;
  for (auto& p : products) {
    if (p.empty()) {
      terms.push_back(ExpressionUtil::newNumber(1));
    } else {
      terms.push_back(newOperation(Expression::Type::PRODUCT, std::move(p)));
    }
  }
  return newOperation(Expression::Type::SUM, std::move(terms));
}

Expression Expander::expandPower(const Expression& base,
                                 const Expression& exponent) const {
  if (exponent.type != Expression::Type::CONSTANT ||
      std::floor(exponent.value) != exponent.value || exponent.value < 0 ||
      !(base.type == Expression::Type::PRODUCT || isDistributable(base))) {
    return ExpressionUtil::pow(base, exponent);
  }
  if (exponent.value > max_exponent) {
    Log::get().debug("Not expanding power with exponent " +
                     exponent.toString() + " above limit " +
                     std::to_string(max_exponent));
    return ExpressionUtil::pow(base, exponent);
  }
  if (exponent.value == 0) {
    return ExpressionUtil::newNumber(1);
  }
  // repeated multiplication, collecting like terms after every step
  auto result = base;
  for (int64_t i = 1; i < static_cast<int64_t>(exponent.value); i++) {
    result = multiply(result, base);
  }
  return result;
}

Expression Expander::multiply(const Expression& a,
                              const Expression& b) const {
  return Simplifier::simplify(distribute({a, b}));
}

Expression Expander::expandTerms(const Expression& e) const {
  // simplified children expose sums hidden behind neutral operations
  std::vector<Expression> children;
  for (const auto& c : e.children) {
    children.push_back(Simplifier::simplify(expandTerms(c)));
  }
  switch (e.type) {
    case Expression::Type::CONSTANT:
    case Expression::Type::VARIABLE:
      return e;
    case Expression::Type::SUM: {
      std::vector<Expression> terms;
      for (const auto& c : children) {
        ExpressionUtil::flatten(Expression::Type::SUM, c, terms);
      }
      return newOperation(Expression::Type::SUM, std::move(terms));
    }
    case Expression::Type::PRODUCT: {
      if (children.size() < 2) {
        return distribute(children);
      }
      auto result = children[0];
      for (size_t i = 1; i < children.size(); i++) {
        result = multiply(result, children[i]);
      }
      return result;
    }
    case Expression::Type::POWER:
      if (children.size() == 2) {
        return expandPower(children[0], children[1]);
      }
      break;
    case Expression::Type::DIFFERENCE:
    case Expression::Type::FRACTION:
      break;
  }
  Expression result(e.type, e.symbol, e.value);
  result.children = std::move(children);
  return result;
}
