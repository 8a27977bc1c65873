#pragma once

#include "form/expression.hpp"

/**
 * Canonicalizing rewrite of expressions. Simplification works bottom-up: the
 * children of a node are simplified first, then the node itself is rewritten
 * by folding constants, collecting like terms in sums and like factors in
 * products, and removing neutral elements. Products over sums are not
 * multiplied out (see Expander).
 *
 * Simplification never fails and is idempotent: simplifying an already
 * simplified expression returns an equal expression. Sums and products in the
 * result are stored in canonical order.
 *
 * Example: x + 2*x + 3 + 4 is simplified to 3x + 7
 */
class Simplifier {
 public:
  static Expression simplify(const Expression& e);
};
