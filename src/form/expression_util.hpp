#pragma once

#include <set>
#include <utility>
#include <vector>

#include "form/expression.hpp"

/**
 * Expression utility functions.
 */
class ExpressionUtil {
 public:
  static Expression newNumber(double value);

  static Expression newVariable(const std::string& name);

  static Expression newVariable(const Symbol& symbol);

  // Binary builders. Sums and products that are passed as an operand of
  // add() or mul() respectively are flattened into the result.
  static Expression add(const Expression& a, const Expression& b);

  static Expression sub(const Expression& a, const Expression& b);

  static Expression mul(const Expression& a, const Expression& b);

  static Expression div(const Expression& a, const Expression& b);

  static Expression pow(const Expression& a, const Expression& b);

  // Appends e to target, or its children if it has the given type. Nested
  // operations of the same type are flattened recursively.
  static void flatten(Expression::Type type, const Expression& e,
                      std::vector<Expression>& target);

  /**
   * Splits off the sign of a negative constant or of a product with negative
   * constant factors. Returns the absolute expression and whether the sign
   * was negative.
   */
  static std::pair<Expression, bool> extractSign(const Expression& e);

  /**
   * Total degree of an expression, e.g. 3 for 2*x^2*y. Constants have degree
   * zero, non-constant exponents count as one.
   */
  static double degree(const Expression& e);

  /**
   * Sorts the factors of a product into canonical order: constants first,
   * then by the printed base of each factor, then by ascending exponent.
   */
  static void sortFactors(std::vector<Expression>& factors);

  /**
   * Sorts the terms of a sum into canonical order: descending degree, then
   * graded lexicographic order of the factors, constants last.
   */
  static void sortTerms(std::vector<Expression>& terms);

  static void collectSymbols(const Expression& e, std::set<Symbol>& target);
};
