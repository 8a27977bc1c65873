#include "form/expression_util.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

Expression ExpressionUtil::newNumber(double value) {
  return Expression(Expression::Type::CONSTANT, Symbol(), value);
}

Expression ExpressionUtil::newVariable(const std::string& name) {
  return Expression(Expression::Type::VARIABLE, Symbol(name));
}

Expression ExpressionUtil::newVariable(const Symbol& symbol) {
  return Expression(Expression::Type::VARIABLE, symbol);
}

void ExpressionUtil::flatten(Expression::Type type, const Expression& e,
                             std::vector<Expression>& target) {
  if (e.type == type) {
    for (const auto& c : e.children) {
      flatten(type, c, target);
    }
  } else {
    target.push_back(e);
  }
}

Expression newFlattened(Expression::Type type, const Expression& a,
                        const Expression& b) {
  Expression result(type);
  ExpressionUtil::flatten(type, a, result.children);
  ExpressionUtil::flatten(type, b, result.children);
  return result;
}

Expression ExpressionUtil::add(const Expression& a, const Expression& b) {
  return newFlattened(Expression::Type::SUM, a, b);
}

Expression ExpressionUtil::sub(const Expression& a, const Expression& b) {
  return Expression(Expression::Type::DIFFERENCE, {a, b});
}

Expression ExpressionUtil::mul(const Expression& a, const Expression& b) {
  return newFlattened(Expression::Type::PRODUCT, a, b);
}

Expression ExpressionUtil::div(const Expression& a, const Expression& b) {
  return Expression(Expression::Type::FRACTION, {a, b});
}

Expression ExpressionUtil::pow(const Expression& a, const Expression& b) {
  return Expression(Expression::Type::POWER, {a, b});
}

std::pair<Expression, bool> ExpressionUtil::extractSign(const Expression& e) {
  std::pair<Expression, bool> result;
  switch (e.type) {
    case Expression::Type::CONSTANT:
      result.first = e;
      if (e.value < 0) {
        result.first.value = -e.value;
        result.second = true;
      } else {
        result.second = false;
      }
      break;
    case Expression::Type::PRODUCT:
      result.first.type = Expression::Type::PRODUCT;
      result.second = false;
      for (auto& c : e.children) {
        if (c.type == Expression::Type::CONSTANT && c.value < 0) {
          auto constant = c;  // copy
          constant.value = -c.value;
          if (constant.value != 1) {
            result.first.newChild(constant);
          }
          result.second = !result.second;
        } else {
          result.first.newChild(c);
        }
      }
      if (result.first.children.empty()) {
        result.first.newChild(newNumber(1));
      }
      break;
    case Expression::Type::VARIABLE:
    case Expression::Type::SUM:
    case Expression::Type::DIFFERENCE:
    case Expression::Type::FRACTION:
    case Expression::Type::POWER:
      result.first = e;
      result.second = false;
      break;
  }
  return result;
}

double sanitizeDegree(double d) { return std::isfinite(d) ? d : 0; }

double ExpressionUtil::degree(const Expression& e) {
  double result = 0;
  switch (e.type) {
    case Expression::Type::CONSTANT:
      result = 0;
      break;
    case Expression::Type::VARIABLE:
      result = 1;
      break;
    case Expression::Type::SUM:
    case Expression::Type::DIFFERENCE:
      for (const auto& c : e.children) {
        result = std::max(result, degree(c));
      }
      break;
    case Expression::Type::PRODUCT:
      for (const auto& c : e.children) {
        result += degree(c);
      }
      break;
    case Expression::Type::FRACTION:
      if (e.children.size() == 2) {
        result = degree(e.children[0]) - degree(e.children[1]);
      }
      break;
    case Expression::Type::POWER:
      if (e.children.size() == 2) {
        result = degree(e.children[0]);
        if (e.children[1].type == Expression::Type::CONSTANT) {
          result *= e.children[1].value;
        }
      }
      break;
  }
  return sanitizeDegree(result);
}

/**
 * Sort key of a single factor: its base and the exponent it is raised to.
 */
class FactorKey {
 public:
  explicit FactorKey(const Expression& e)
      : constant(e.type == Expression::Type::CONSTANT), exponent(1) {
    if (e.type == Expression::Type::POWER && e.children.size() == 2) {
      base = e.children[0].toString();
      if (e.children[1].type == Expression::Type::CONSTANT) {
        exponent = sanitizeDegree(e.children[1].value);
      }
    } else if (!constant) {
      base = e.toString();
    }
  }

  bool constant;
  std::string base;
  double exponent;
};

/**
 * Sort key of a term of a sum: its degree and the keys of its non-constant
 * factors in canonical order.
 */
class TermKey {
 public:
  explicit TermKey(const Expression& e)
      : constant(e.type == Expression::Type::CONSTANT),
        degree(ExpressionUtil::degree(e)),
        str(e.toString()) {
    if (e.type == Expression::Type::PRODUCT) {
      std::vector<Expression> residual;
      for (const auto& c : e.children) {
        if (c.type != Expression::Type::CONSTANT) {
          residual.push_back(c);
        }
      }
      ExpressionUtil::sortFactors(residual);
      for (const auto& c : residual) {
        factors.emplace_back(c);
      }
    } else if (!constant) {
      factors.emplace_back(e);
    }
  }

  bool constant;
  double degree;
  std::string str;
  std::vector<FactorKey> factors;
};

int compareFactorKeys(const FactorKey& a, const FactorKey& b) {
  if (a.constant != b.constant) {
    return a.constant ? -1 : 1;
  }
  if (a.base != b.base) {
    return a.base < b.base ? -1 : 1;
  }
  if (a.exponent != b.exponent) {
    return a.exponent < b.exponent ? -1 : 1;
  }
  return 0;
}

int compareTermKeys(const TermKey& a, const TermKey& b) {
  if (a.constant != b.constant) {
    return a.constant ? 1 : -1;
  }
  if (a.degree != b.degree) {
    return a.degree > b.degree ? -1 : 1;
  }
  const size_t n = std::min(a.factors.size(), b.factors.size());
  for (size_t i = 0; i < n; i++) {
    const auto& f = a.factors[i];
    const auto& g = b.factors[i];
    if (f.base != g.base) {
      return f.base < g.base ? -1 : 1;
    }
    // higher powers of the same base first
    if (f.exponent != g.exponent) {
      return f.exponent > g.exponent ? -1 : 1;
    }
  }
  if (a.factors.size() != b.factors.size()) {
    return a.factors.size() < b.factors.size() ? -1 : 1;
  }
  if (a.str != b.str) {
    return a.str < b.str ? -1 : 1;
  }
  return 0;
}

template <class Key>
void sortByKey(std::vector<Expression>& v,
               int (*compareKeys)(const Key&, const Key&)) {
  if (v.size() < 2) {
    return;
  }
  std::vector<Key> keys;
  keys.reserve(v.size());
  for (const auto& e : v) {
    keys.emplace_back(e);
  }
  std::vector<size_t> index(v.size());
  std::iota(index.begin(), index.end(), 0);
  std::sort(index.begin(), index.end(), [&](size_t i, size_t j) {
    auto r = compareKeys(keys[i], keys[j]);
    if (r != 0) {
      return r < 0;
    }
    return v[i].compare(v[j]) < 0;
  });
  std::vector<Expression> sorted;
  sorted.reserve(v.size());
  for (auto i : index) {
    sorted.push_back(std::move(v[i]));
  }
  v = std::move(sorted);
}

void ExpressionUtil::sortFactors(std::vector<Expression>& factors) {
  sortByKey<FactorKey>(factors, compareFactorKeys);
}

void ExpressionUtil::sortTerms(std::vector<Expression>& terms) {
  sortByKey<TermKey>(terms, compareTermKeys);
}

void ExpressionUtil::collectSymbols(const Expression& e,
                                    std::set<Symbol>& target) {
  if (e.type == Expression::Type::VARIABLE) {
    target.insert(e.symbol);
  }
  for (const auto& c : e.children) {
    collectSymbols(c, target);
  }
}
