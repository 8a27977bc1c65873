#pragma once

#include <vector>

#include "form/expression.hpp"
#include "sys/util.hpp"

/**
 * Multiplies out products of sums using the distributive law. Every product
 * that has a sum or a difference among its factors is rewritten into a sum
 * of products, one for each combination of summands. Powers of sums with a
 * small non-negative integer exponent are treated as repeated products. The
 * result is simplified to collect the expanded terms.
 *
 * Example: (x+y)^2 is expanded to x^2 + 2xy + y^2
 */
class Expander {
 public:
  Expander();

  explicit Expander(const Settings& settings);

  Expression expand(const Expression& e) const;

 private:
  Expression expandTerms(const Expression& e) const;

  Expression expandPower(const Expression& base,
                         const Expression& exponent) const;

  Expression distribute(const std::vector<Expression>& factors) const;

  Expression multiply(const Expression& a, const Expression& b) const;

  const int64_t max_exponent;
};
