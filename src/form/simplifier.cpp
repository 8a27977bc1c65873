#include "form/simplifier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "form/expression_util.hpp"

Expression simplifySum(const std::vector<Expression>& operands);

Expression simplifyProduct(const std::vector<Expression>& operands);

// splits a term into its numeric coefficient and the remaining factors
std::pair<double, std::vector<Expression>> splitCoefficient(
    const Expression& e) {
  std::pair<double, std::vector<Expression>> result;
  result.first = 1;
  if (e.type == Expression::Type::PRODUCT) {
    for (const auto& c : e.children) {
      if (c.type == Expression::Type::CONSTANT) {
        result.first *= c.value;
      } else {
        result.second.push_back(c);
      }
    }
  } else {
    result.second.push_back(e);
  }
  return result;
}

Expression newTerm(double coefficient, const std::vector<Expression>& factors) {
  if (coefficient == 1 && factors.size() == 1) {
    return factors.front();
  }
  Expression term(Expression::Type::PRODUCT);
  if (coefficient != 1) {
    term.newChild(ExpressionUtil::newNumber(coefficient));
  }
  for (const auto& f : factors) {
    term.newChild(f);
  }
  ExpressionUtil::sortFactors(term.children);
  return term;
}

Expression simplifySum(const std::vector<Expression>& operands) {
  std::vector<Expression> flat;
  for (const auto& c : operands) {
    ExpressionUtil::flatten(Expression::Type::SUM, c, flat);
  }
  double constant = 0;
  // like terms share the same factors and differ only in the coefficient
  std::vector<std::pair<Expression, double>> terms;
  for (const auto& c : flat) {
    if (c.type == Expression::Type::CONSTANT) {
      constant += c.value;
      continue;
    }
    auto split = splitCoefficient(c);
    if (split.second.empty()) {
      constant += split.first;
      continue;
    }
    auto residual = newTerm(1, split.second);
    auto it = std::find_if(
        terms.begin(), terms.end(),
        [&](const std::pair<Expression, double>& t) {
          return t.first == residual;
        });
    if (it == terms.end()) {
      terms.emplace_back(residual, split.first);
    } else {
      it->second += split.first;
    }
  }
  std::vector<Expression> result;
  bool regroup = false;
  for (const auto& t : terms) {
    if (t.second == 0) {
      continue;
    }
    std::vector<Expression> factors;
    if (t.first.type == Expression::Type::PRODUCT) {
      factors = t.first.children;
    } else {
      factors.push_back(t.first);
    }
    result.push_back(newTerm(t.second, factors));
    // a sum with coefficient one is spliced and its summands collected again
    if (result.back().type == Expression::Type::SUM) {
      regroup = true;
    }
  }
  if (regroup) {
    result.push_back(ExpressionUtil::newNumber(constant));
    return simplifySum(result);
  }
  if (result.empty()) {
    return ExpressionUtil::newNumber(constant + 0.0);
  }
  if (constant != 0) {
    result.push_back(ExpressionUtil::newNumber(constant));
  }
  if (result.size() == 1) {
    return result.front();
  }
  ExpressionUtil::sortTerms(result);
  Expression sum(Expression::Type::SUM);
  sum.children = std::move(result);
  return sum;
}

Expression simplifyDifference(const Expression& a, const Expression& b) {
  if (a.type == Expression::Type::CONSTANT &&
      b.type == Expression::Type::CONSTANT) {
    return ExpressionUtil::newNumber(a.value - b.value);
  }
  if (b.isConstant(0)) {
    return a;
  }
  return ExpressionUtil::sub(a, b);
}

Expression simplifyFraction(const Expression& a, const Expression& b) {
  if (a.type == Expression::Type::CONSTANT &&
      b.type == Expression::Type::CONSTANT && b.value != 0) {
    return ExpressionUtil::newNumber(a.value / b.value);
  }
  // division by zero is kept and reported by the evaluator
  if (b.isConstant(0)) {
    return ExpressionUtil::div(a, b);
  }
  if (b.isConstant(1)) {
    return a;
  }
  return ExpressionUtil::div(a, b);
}

Expression simplifyPower(const Expression& a, const Expression& b) {
  if (a.type == Expression::Type::CONSTANT &&
      b.type == Expression::Type::CONSTANT) {
    return ExpressionUtil::newNumber(std::pow(a.value, b.value));
  }
  if (b.isConstant(0)) {
    return ExpressionUtil::newNumber(1);  // includes 0^0
  }
  if (b.isConstant(1)) {
    return a;
  }
  if (a.isConstant(1)) {
    return ExpressionUtil::newNumber(1);
  }
  return ExpressionUtil::pow(a, b);
}

const Expression& baseOf(const Expression& e) {
  if (e.type == Expression::Type::POWER && e.children.size() == 2) {
    return e.children[0];
  }
  return e;
}

Expression simplifyProduct(const std::vector<Expression>& operands) {
  std::vector<Expression> flat;
  for (const auto& c : operands) {
    ExpressionUtil::flatten(Expression::Type::PRODUCT, c, flat);
  }
  double constant = 1;
  // like factors share the same base; their exponents are added up
  std::vector<std::pair<Expression, std::vector<Expression>>> groups;
  for (const auto& c : flat) {
    if (c.type == Expression::Type::CONSTANT) {
      constant *= c.value;
      continue;
    }
    const auto& base = baseOf(c);
    auto exponent =
        (&base == &c) ? ExpressionUtil::newNumber(1) : c.children[1];
    auto it = std::find_if(
        groups.begin(), groups.end(),
        [&](const std::pair<Expression, std::vector<Expression>>& g) {
          return g.first == base;
        });
    if (it == groups.end()) {
      groups.emplace_back(base, std::vector<Expression>{exponent});
    } else {
      it->second.push_back(exponent);
    }
  }
  if (constant == 0) {
    return ExpressionUtil::newNumber(0);
  }
  std::vector<Expression> factors;
  bool regroup = false;
  for (const auto& g : groups) {
    auto exponent =
        g.second.size() == 1 ? g.second.front() : simplifySum(g.second);
    auto f = simplifyPower(g.first, exponent);
    if (f.type == Expression::Type::CONSTANT) {
      constant *= f.value;
      continue;
    }
    // a power that collapsed to its base may now merge with other factors
    if (f.type == Expression::Type::PRODUCT || baseOf(f) != g.first) {
      regroup = true;
    }
    factors.push_back(f);
  }
  if (regroup) {
    factors.push_back(ExpressionUtil::newNumber(constant));
    return simplifyProduct(factors);
  }
  if (constant == 0) {
    return ExpressionUtil::newNumber(0);
  }
  if (factors.empty()) {
    return ExpressionUtil::newNumber(constant);
  }
  return newTerm(constant, factors);
}

Expression Simplifier::simplify(const Expression& e) {
  std::vector<Expression> children;
  for (const auto& c : e.children) {
    children.push_back(simplify(c));
  }
  // malformed binary nodes are kept as they are
  const bool binary = (children.size() == 2);
  switch (e.type) {
    case Expression::Type::CONSTANT:
    case Expression::Type::VARIABLE:
      return e;
    case Expression::Type::SUM:
      return simplifySum(children);
    case Expression::Type::PRODUCT:
      return simplifyProduct(children);
    case Expression::Type::DIFFERENCE:
      if (binary) {
        return simplifyDifference(children[0], children[1]);
      }
      break;
    case Expression::Type::FRACTION:
      if (binary) {
        return simplifyFraction(children[0], children[1]);
      }
      break;
    case Expression::Type::POWER:
      if (binary) {
        return simplifyPower(children[0], children[1]);
      }
      break;
  }
  Expression result(e.type, e.symbol, e.value);
  result.children = std::move(children);
  return result;
}
